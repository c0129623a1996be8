#pragma once
#include "probe_result.h"
#include <map>
#include <string>
#include <vector>

/**
 * @file report.h
 * @brief The single artifact produced by a probe run
 *
 * Built once per run. Consumers (JSON writer, console summary) only ever
 * read it. Every field has a valid empty state, so a cancelled run still
 * yields a usable report.
 */

struct Report {
    std::map<std::string, ClassifiedResult> results;
    std::map<Category, int> counts_by_category;
    std::vector<std::string> recommendations;

    std::string run_id;
    std::string started_at;
    std::string finished_at;
    bool cancelled = false;

    int count(Category c) const {
        auto it = counts_by_category.find(c);
        return it == counts_by_category.end() ? 0 : it->second;
    }
};
