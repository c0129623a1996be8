/**
 * @file test_catalog.cpp
 * @brief Unit tests for catalog construction and loading
 */

#include <catch2/catch.hpp>
#include "catalog/catalog.h"
#include "helpers/http_test_helpers.h"
#include <fstream>
#include <set>
#include <stdexcept>

using namespace catalog;

static std::string write_file(const std::string& name, const std::string& content) {
    std::string path = test_helpers::temp_path(name);
    std::ofstream out(path);
    out << content;
    return path;
}

TEST_CASE("Catalog rejects invalid entries", "[catalog]") {
    Catalog c;
    c.add(test_helpers::make_target("a", "https://a.test/"));

    REQUIRE_THROWS_AS(c.add(test_helpers::make_target("a", "https://b.test/")), std::invalid_argument);
    REQUIRE_THROWS_AS(c.add(test_helpers::make_target("", "https://b.test/")), std::invalid_argument);
    REQUIRE_THROWS_AS(c.add(test_helpers::make_target("b", "")), std::invalid_argument);
    REQUIRE(c.size() == 1);
    REQUIRE(c.find("a") != nullptr);
    REQUIRE(c.find("b") == nullptr);
}

TEST_CASE("Built-in catalog is well formed", "[catalog]") {
    Catalog c = Catalog::builtin();
    REQUIRE(c.size() >= 20);

    std::set<std::string> labels;
    bool has_deep_scan = false;
    bool has_follow_form = false;
    for (const auto& t : c.targets()) {
        REQUIRE(labels.insert(t.label).second);
        REQUIRE(t.label.find("/discovered/") == std::string::npos);
        REQUIRE((t.url.rfind("https://", 0) == 0 || t.url.rfind("http://", 0) == 0));
        if (t.variant == ProbeVariant::DEEP_SCAN) has_deep_scan = true;
        if (t.variant == ProbeVariant::FOLLOW_FORM) has_follow_form = true;
    }
    REQUIRE(has_deep_scan);
    REQUIRE(has_follow_form);

    const ProbeTarget* xhr = c.find("google_patents_xhr_query");
    REQUIRE(xhr != nullptr);
    REQUIRE(xhr->hint == ResponseHint::EXPECT_JSON);
    REQUIRE(xhr->params.at("content") == "1");
}

TEST_CASE("Catalog loads JSON files", "[catalog]") {
    SECTION("valid file") {
        std::string path = write_file("apiscout_catalog_ok.json", R"({
            "targets": [
                {"label": "api", "url": "https://a.test/api", "params": {"q": "x", "n": 2}, "hint": "json"},
                {"label": "portal", "url": "https://a.test/", "variant": "deep_scan"},
                {"label": "home", "url": "https://b.test/", "variant": "follow_form", "hint": "xml"}
            ]
        })");
        Catalog c = Catalog::load(path);
        REQUIRE(c.size() == 3);
        REQUIRE(c.targets()[0].label == "api");
        REQUIRE(c.targets()[0].params.at("q") == "x");
        REQUIRE(c.targets()[0].params.at("n") == "2");
        REQUIRE(c.targets()[0].hint == ResponseHint::EXPECT_JSON);
        REQUIRE(c.targets()[0].variant == ProbeVariant::PLAIN);
        REQUIRE(c.targets()[1].variant == ProbeVariant::DEEP_SCAN);
        REQUIRE(c.targets()[2].variant == ProbeVariant::FOLLOW_FORM);
        REQUIRE(c.targets()[2].hint == ResponseHint::EXPECT_XML);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(Catalog::load("/nonexistent/apiscout/catalog.json"), std::runtime_error);
    }

    SECTION("not JSON") {
        std::string path = write_file("apiscout_catalog_bad.json", "targets: [");
        REQUIRE_THROWS_AS(Catalog::load(path), std::runtime_error);
    }

    SECTION("unknown variant") {
        std::string path = write_file("apiscout_catalog_variant.json",
            R"({"targets": [{"label": "a", "url": "https://a.test/", "variant": "recursive"}]})");
        REQUIRE_THROWS_WITH(Catalog::load(path), Catch::Contains("unknown probe variant"));
    }

    SECTION("duplicate labels") {
        std::string path = write_file("apiscout_catalog_dup.json",
            R"({"targets": [{"label": "a", "url": "https://a.test/"}, {"label": "a", "url": "https://b.test/"}]})");
        REQUIRE_THROWS_WITH(Catalog::load(path), Catch::Contains("duplicate catalog label"));
    }

    SECTION("missing url") {
        REQUIRE_THROWS_AS(Catalog::from_json(nlohmann::json::parse(R"({"targets": [{"label": "a"}]})")),
                          std::runtime_error);
    }
}

TEST_CASE("Catalog JSON form loads back", "[catalog]") {
    Catalog original = Catalog::builtin();
    Catalog copy = Catalog::from_json(original.to_json());
    REQUIRE(copy.size() == original.size());
    REQUIRE(copy.targets().back().label == original.targets().back().label);
    REQUIRE(copy.targets().back().params == original.targets().back().params);
}
