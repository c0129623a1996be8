#pragma once
#include <schema/probe_target.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace catalog {

// Ordered list of probe targets.
// Labels are unique within a catalog; they key the report, so a duplicate
// would silently hide a result.

class Catalog {
public:
    /**
     * @brief Append a target
     * @param target Target with non-empty label and URL
     * @throws std::invalid_argument on empty label/URL or duplicate label
     */
    void add(const ProbeTarget& target);

    const std::vector<ProbeTarget>& targets() const { return targets_; }
    size_t size() const { return targets_.size(); }
    bool empty() const { return targets_.empty(); }

    /**
     * @brief Find a target by label
     * @return Pointer into the catalog, or nullptr
     */
    const ProbeTarget* find(const std::string& label) const;

    /**
     * @brief Built-in patent data endpoint list
     *
     * Public APIs and web interfaces of the USPTO, PatentsView, Google
     * Patents, EPO and alternative patent databases.
     */
    static Catalog builtin();

    /**
     * @brief Load a catalog from a JSON file
     * @param path File of the form {"targets":[{"label","url","params","variant","hint"}]}
     * @return Loaded catalog
     * @throws std::runtime_error if the file is missing or malformed
     */
    static Catalog load(const std::string& path);

    /**
     * @brief Build a catalog from an already-parsed JSON document
     * @throws std::runtime_error if the document is malformed
     */
    static Catalog from_json(const nlohmann::json& doc);

    nlohmann::json to_json() const;

private:
    std::vector<ProbeTarget> targets_;
};

/**
 * @brief Parse a variant name ("plain", "follow_form", "deep_scan")
 * @throws std::runtime_error on unknown names
 */
ProbeVariant parse_variant(const std::string& name);

/**
 * @brief Parse a hint name ("none", "json", "xml")
 * @throws std::runtime_error on unknown names
 */
ResponseHint parse_hint(const std::string& name);

} // namespace catalog
