#pragma once
#include <schema/report.h>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace report {

/**
 * @brief Serialize a report
 * @param r Report to serialize
 * @return JSON object with run metadata, results keyed by label,
 *         counts for all six categories and recommendations
 */
nlohmann::json to_json(const Report& r);

/**
 * @brief Write a report as pretty-printed JSON
 * @param r Report to write
 * @param path Output file; parent directories are created
 * @return true if the file was written
 */
bool write_json(const Report& r, const std::string& path);

/**
 * @brief Print a human-readable summary grouped by category
 * @param r Report to print
 * @param out Stream to print to
 */
void print_summary(const Report& r, std::ostream& out);

/**
 * @brief One progress line for a freshly classified result
 */
std::string format_progress(const ClassifiedResult& result);

} // namespace report
