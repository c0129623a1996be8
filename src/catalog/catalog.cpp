/**
 * @file catalog.cpp
 * @brief Probe target catalogs: built-in list and JSON files
 */

#include "catalog.h"
#include <fstream>
#include <set>
#include <stdexcept>

namespace catalog {

using json = nlohmann::json;

/// Shorthand for building catalog entries.
static ProbeTarget make_target(const std::string& label,
                               const std::string& url,
                               ProbeVariant variant = ProbeVariant::PLAIN,
                               ResponseHint hint = ResponseHint::NONE,
                               std::map<std::string, std::string> params = {}) {
    ProbeTarget t;
    t.label = label;
    t.url = url;
    t.params = std::move(params);
    t.variant = variant;
    t.hint = hint;
    return t;
}

ProbeVariant parse_variant(const std::string& name) {
    if (name.empty() || name == "plain") return ProbeVariant::PLAIN;
    if (name == "follow_form") return ProbeVariant::FOLLOW_FORM;
    if (name == "deep_scan") return ProbeVariant::DEEP_SCAN;
    throw std::runtime_error("unknown probe variant: " + name);
}

ResponseHint parse_hint(const std::string& name) {
    if (name.empty() || name == "none") return ResponseHint::NONE;
    if (name == "json") return ResponseHint::EXPECT_JSON;
    if (name == "xml") return ResponseHint::EXPECT_XML;
    throw std::runtime_error("unknown response hint: " + name);
}

void Catalog::add(const ProbeTarget& target) {
    if (target.label.empty()) {
        throw std::invalid_argument("catalog entry without label: " + target.url);
    }
    if (target.url.empty()) {
        throw std::invalid_argument("catalog entry without URL: " + target.label);
    }
    if (find(target.label)) {
        throw std::invalid_argument("duplicate catalog label: " + target.label);
    }
    targets_.push_back(target);
}

const ProbeTarget* Catalog::find(const std::string& label) const {
    for (const auto& t : targets_) {
        if (t.label == label) return &t;
    }
    return nullptr;
}

Catalog Catalog::builtin() {
    using V = ProbeVariant;
    using H = ResponseHint;
    Catalog c;

    // PatentsView
    c.add(make_target("patentsview_legacy_query", "https://api.patentsview.org/patents/query",
                      V::PLAIN, H::EXPECT_JSON,
                      {{"q", "{\"_text_any\":{\"patent_title\":\"artificial intelligence\"}}"},
                       {"f", "[\"patent_number\",\"patent_title\",\"patent_date\"]"},
                       {"o", "{\"per_page\":2}"}}));
    c.add(make_target("patentsview_search_api", "https://search.patentsview.org/api/v1/patent/",
                      V::PLAIN, H::EXPECT_JSON,
                      {{"q", "{\"patent_title\":\"artificial intelligence\"}"},
                       {"f", "[\"patent_id\",\"patent_title\"]"}}));
    c.add(make_target("patentsview_home", "https://patentsview.org/"));

    // USPTO APIs
    c.add(make_target("uspto_assignment_search", "https://assignment-api.uspto.gov/patent/search",
                      V::PLAIN, H::EXPECT_XML, {{"query", "artificial"}, {"format", "xml"}}));
    c.add(make_target("uspto_assignment_swagger", "https://assignment-api.uspto.gov/patent/swaggerui/index.html"));
    c.add(make_target("uspto_tsdr_xml", "https://tsdrapi.uspto.gov/ts/cd/casestatus/sn88123456/info.xml",
                      V::PLAIN, H::EXPECT_XML));
    c.add(make_target("uspto_tsdr_json", "https://tsdrapi.uspto.gov/ts/cd/casestatus/sn79218695/info.json",
                      V::PLAIN, H::EXPECT_JSON));
    c.add(make_target("uspto_peds_queries", "https://ped.uspto.gov/api/queries", V::PLAIN, H::EXPECT_JSON));
    c.add(make_target("uspto_ptab_search", "https://api.uspto.gov/ptab/v2/search", V::PLAIN, H::EXPECT_JSON));
    c.add(make_target("uspto_ptab_swagger", "https://developer.uspto.gov/ptab-api/swagger-ui/index.html"));

    // Portals and bulk data
    c.add(make_target("uspto_developer_portal", "https://developer.uspto.gov/"));
    c.add(make_target("uspto_api_catalog", "https://developer.uspto.gov/api-catalog", V::DEEP_SCAN));
    c.add(make_target("uspto_open_data_portal", "https://data.uspto.gov/", V::DEEP_SCAN));
    c.add(make_target("uspto_open_data_api", "https://data.uspto.gov/api/", V::PLAIN, H::EXPECT_JSON));
    c.add(make_target("uspto_bulkdata", "https://bulkdata.uspto.gov/"));
    c.add(make_target("uspto_bulk_data_products", "https://www.uspto.gov/learning-and-resources/bulk-data-products"));
    c.add(make_target("uspto_application_status", "https://www.uspto.gov/patents/apply/status/application-status-search"));

    // Patent Public Search
    c.add(make_target("ppubs_home", "https://ppubs.uspto.gov/pubwebapp/", V::DEEP_SCAN));
    c.add(make_target("ppubs_search_api", "https://ppubs.uspto.gov/pubwebapp/api/search",
                      V::PLAIN, H::EXPECT_JSON));
    c.add(make_target("ppubs_searches", "https://ppubs.uspto.gov/dirsearch-public/searches",
                      V::PLAIN, H::EXPECT_JSON));

    // Google Patents
    c.add(make_target("google_patents_home", "https://patents.google.com/", V::FOLLOW_FORM));
    c.add(make_target("google_patents_xhr_query", "https://patents.google.com/xhr/query",
                      V::PLAIN, H::EXPECT_JSON,
                      {{"url", "q=artificial+intelligence&num=2"}, {"exp", ""}, {"content", "1"}}));
    c.add(make_target("google_patents_document", "https://patents.google.com/patent/US10000000B2"));

    // EPO
    c.add(make_target("epo_ops_biblio_search", "https://ops.epo.org/3.2/rest-services/published-data/search/biblio",
                      V::PLAIN, H::EXPECT_XML, {{"q", "ti=artificial intelligence"}}));
    c.add(make_target("espacenet_home", "https://worldwide.espacenet.com/"));

    // Alternative databases
    c.add(make_target("lens_home", "https://www.lens.org/lens/"));
    c.add(make_target("wipo_branddb", "https://www3.wipo.int/branddb/en/"));
    c.add(make_target("freepatentsonline_search", "http://www.freepatentsonline.com/search.html", V::DEEP_SCAN));

    // Direct document access
    c.add(make_target("ppubs_pdf_download", "https://ppubs.uspto.gov/dirsearch-public/print/downloadPdf/10000000"));
    c.add(make_target("patft_parser", "https://patft.uspto.gov/netacgi/nph-Parser",
                      V::PLAIN, H::NONE, {{"patentnumber", "10000000"}}));

    return c;
}

Catalog Catalog::from_json(const json& doc) {
    if (!doc.is_object() || !doc.contains("targets") || !doc["targets"].is_array()) {
        throw std::runtime_error("catalog must be an object with a \"targets\" array");
    }

    Catalog c;
    size_t index = 0;
    for (const auto& entry : doc["targets"]) {
        const std::string where = "catalog entry " + std::to_string(index++);
        if (!entry.is_object()) {
            throw std::runtime_error(where + " is not an object");
        }
        if (!entry.contains("label") || !entry["label"].is_string() ||
            !entry.contains("url") || !entry["url"].is_string()) {
            throw std::runtime_error(where + " needs string \"label\" and \"url\"");
        }

        ProbeTarget t;
        t.label = entry["label"].get<std::string>();
        t.url = entry["url"].get<std::string>();

        if (entry.contains("params")) {
            if (!entry["params"].is_object()) {
                throw std::runtime_error(where + ": \"params\" must be an object");
            }
            for (auto& [key, value] : entry["params"].items()) {
                t.params[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }

        try {
            t.variant = parse_variant(entry.value("variant", "plain"));
            t.hint = parse_hint(entry.value("hint", "none"));
            c.add(t);
        } catch (const std::exception& e) {
            throw std::runtime_error(where + ": " + e.what());
        }
    }
    return c;
}

Catalog Catalog::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open catalog file: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    json doc = json::parse(content, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("catalog file is not valid JSON: " + path);
    }
    return from_json(doc);
}

json Catalog::to_json() const {
    json arr = json::array();
    for (const auto& t : targets_) {
        json j;
        j["label"] = t.label;
        j["url"] = t.url;
        j["params"] = t.params;
        j["variant"] = to_string(t.variant);
        j["hint"] = to_string(t.hint);
        arr.push_back(j);
    }
    json doc;
    doc["targets"] = arr;
    return doc;
}

} // namespace catalog
