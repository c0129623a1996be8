/**
 * @file test_content_parser.cpp
 * @brief Unit tests for JSON, XML and HTML inspection helpers
 */

#include <catch2/catch.hpp>
#include "core/content_parser.h"

TEST_CASE("parse_json accepts valid documents only", "[parser]") {
    nlohmann::json out;
    std::string error;

    REQUIRE(parse_json("{\"a\": 1}", out, error));
    REQUIRE(out["a"] == 1);

    REQUIRE(parse_json("  [1, 2, 3]\n", out, error));
    REQUIRE(out.size() == 3);

    REQUIRE_FALSE(parse_json("{\"a\": ", out, error));
    REQUIRE_FALSE(error.empty());

    REQUIRE_FALSE(parse_json("", out, error));
    REQUIRE_FALSE(parse_json("<html></html>", out, error));
}

TEST_CASE("is_well_formed_xml checks structure, not schema", "[parser]") {
    REQUIRE(is_well_formed_xml("<?xml version=\"1.0\"?><a><b x=\"1\"/></a>"));
    REQUIRE(is_well_formed_xml("<root/>"));

    REQUIRE_FALSE(is_well_formed_xml("not-xml-at-all"));
    REQUIRE_FALSE(is_well_formed_xml("<a><b></a>"));
    REQUIRE_FALSE(is_well_formed_xml(""));
    REQUIRE_FALSE(is_well_formed_xml("<p>one<p>two"));
}

TEST_CASE("extract_markup finds scripts, forms and links", "[parser]") {
    const std::string html =
        "<html><head><script>var api = '/api/search';</script>"
        "<script src=\"/static/app.js\"></script></head>"
        "<body>"
        "<form action=\"/search\" method=\"post\">"
        "  <input name=\"q\" value=\"default\"><input name=\"page\">"
        "</form>"
        "<div><form action=\"/advanced\"></form></div>"
        "<a href=\"/help\">help</a><a>no href</a>"
        "</body></html>";

    MarkupScan scan = extract_markup(html);

    REQUIRE(scan.scripts.size() == 1);
    REQUIRE(scan.scripts[0] == "var api = '/api/search';");

    REQUIRE(scan.forms.size() == 2);
    REQUIRE(scan.forms[0].action == "/search");
    REQUIRE(scan.forms[0].method == "post");
    REQUIRE(scan.forms[0].inputs.size() == 2);
    REQUIRE(scan.forms[0].inputs[0].first == "q");
    REQUIRE(scan.forms[0].inputs[0].second == "default");
    REQUIRE(scan.forms[1].action == "/advanced");

    REQUIRE(scan.links.size() == 1);
    REQUIRE(scan.links[0] == "/help");
}

TEST_CASE("extract_markup tolerates broken markup", "[parser]") {
    MarkupScan scan = extract_markup("<form action=/find><input name=q><p>unclosed");
    REQUIRE(scan.forms.size() == 1);
    REQUIRE(scan.forms[0].action == "/find");

    MarkupScan empty = extract_markup("");
    REQUIRE(empty.forms.empty());
    REQUIRE(empty.scripts.empty());
}

TEST_CASE("find_script_endpoints picks URL-like literals", "[parser]") {
    auto found = find_script_endpoints(
        "const a = \"/api/v2/items\";"
        "const b = 'https://example.test/search?q=';"
        "const c = `/static/img.png`;"
        "const d = 'not a url /api/';"
        "const e = \"/api/v2/items\";");
    REQUIRE(found.size() == 2);
    REQUIRE(found[0] == "/api/v2/items");
    REQUIRE(found[1] == "https://example.test/search?q=");
}

TEST_CASE("resolve_url", "[parser]") {
    REQUIRE(resolve_url("https://example.test/app/page.html", "/search") == "https://example.test/search");
    REQUIRE(resolve_url("https://example.test/app/page.html", "next.html") == "https://example.test/app/next.html");
    REQUIRE(resolve_url("https://example.test/", "/find#top") == "https://example.test/find");
    REQUIRE(resolve_url("https://example.test/", "").empty());


    SECTION("an absolute URL resolved against itself comes back normalized") {
        REQUIRE(resolve_url("https://example.test", "https://example.test") == "https://example.test/");
        REQUIRE(resolve_url("https://example.test/docs/../api", "https://example.test/docs/../api") ==
                "https://example.test/api");
    }
}
