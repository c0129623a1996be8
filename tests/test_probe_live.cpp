/**
 * @file test_probe_live.cpp
 * @brief Live tests of the real HTTP client against the fixture server
 *
 * Hidden from the default run. Start apiscout_fixture_server, then run:
 *   TARGET_URL=http://127.0.0.1:8080 ./apiscout_tests "[live]"
 */

#include <catch2/catch.hpp>
#include "core/classifier.h"
#include "core/probe_runner.h"
#include "core/prober.h"
#include "helpers/http_test_helpers.h"

using namespace test_helpers;

TEST_CASE("Live classification of fixture endpoints", "[.live]") {
    HttpClient client = create_test_client();
    Prober prober(client);
    Classifier classifier;
    const std::string base = get_target_url();

    SECTION("JSON API") {
        ProbeTarget t = make_target("json", base + "/api/patents");
        t.params = {{"q", "solar panel"}};
        auto result = classifier.classify(prober.probe(t));
        REQUIRE(result.category == Category::JSON_API);
    }

    SECTION("invalid JSON") {
        auto result = classifier.classify(prober.probe(make_target("bad", base + "/api/broken")));
        REQUIRE(result.category == Category::MALFORMED);
    }

    SECTION("XML API and malformed XML") {
        REQUIRE(classifier.classify(prober.probe(make_target("x", base + "/xml/status"))).category
                == Category::XML_API);
        REQUIRE(classifier.classify(prober.probe(make_target("bx", base + "/xml/broken"))).category
                == Category::MALFORMED);
        REQUIRE(classifier.classify(prober.probe(make_target("px", base + "/xml/plain"))).category
                == Category::XML_API);
    }

    SECTION("auth and missing") {
        REQUIRE(classifier.classify(prober.probe(make_target("p", base + "/private"))).category
                == Category::AUTH_REQUIRED);
        REQUIRE(classifier.classify(prober.probe(make_target("l", base + "/login-required"))).category
                == Category::AUTH_REQUIRED);
        auto missing = classifier.classify(prober.probe(make_target("m", base + "/missing")));
        REQUIRE(missing.category == Category::UNREACHABLE);
        REQUIRE(missing.note == "HTTP 404");
    }

    SECTION("redirects are followed") {
        auto outcome = prober.probe(make_target("r", base + "/redirect"));
        REQUIRE(outcome.status_code == 200);
        REQUIRE(outcome.effective_url.find("/api/patents") != std::string::npos);
    }

    SECTION("FollowForm reaches the first form action") {
        auto outcome = prober.probe(make_target("f", base + "/search", ProbeVariant::FOLLOW_FORM));
        REQUIRE(outcome.form_action_url == base + "/api/patents");
        REQUIRE(classifier.classify(outcome).category == Category::JSON_API);
    }

    SECTION("FollowForm posts a post form") {
        auto outcome = prober.probe(make_target("b", base + "/bulk", ProbeVariant::FOLLOW_FORM));
        REQUIRE(outcome.form_action_url == base + "/api/submit");
        REQUIRE(outcome.body.find("\"query\":\"solar\"") != std::string::npos);
        REQUIRE(classifier.classify(outcome).category == Category::JSON_API);
    }

    SECTION("bulk data pages list their downloads") {
        auto result = classifier.classify(prober.probe(make_target("bulk", base + "/bulk")));
        REQUIRE(result.category == Category::HTML_SCRAPABLE);
        REQUIRE(result.download_links.size() == 2);
        REQUIRE(result.download_links[0] == base + "/files/grants_2024.zip");
    }
}

TEST_CASE("Live timeout is classified as unreachable", "[.live]") {
    HttpClient client = create_test_client();
    Prober::Options opts;
    opts.timeout_seconds = 1;
    Prober prober(client, opts);
    Classifier classifier;

    ProbeTarget t = make_target("slow", get_target_url() + "/slow");
    t.params = {{"s", "3"}};
    auto result = classifier.classify(prober.probe(t));
    REQUIRE(result.category == Category::UNREACHABLE);
    REQUIRE(result.note.rfind("timeout: ", 0) == 0);
}

TEST_CASE("Live refused connection is unreachable", "[.live]") {
    HttpClient client = create_test_client();
    Prober prober(client);
    auto outcome = prober.probe(make_target("closed", "http://127.0.0.1:9/"));
    REQUIRE(outcome.transport == TransportStatus::CONNECTION_ERROR);
}

TEST_CASE("Live DeepScan run over the fixture search page", "[.live]") {
    HttpClient client = create_test_client();
    Prober prober(client);
    Classifier classifier;
    ProbeRunner runner(prober, classifier);
    const std::string base = get_target_url();

    Report report = runner.run({make_target("search", base + "/search", ProbeVariant::DEEP_SCAN)});

    REQUIRE(report.results.at("search").category == Category::HTML_SCRAPABLE);
    REQUIRE(report.results.at("search").secondary_targets.size() == 2);
    REQUIRE(report.results.at("search/discovered/1").category == Category::JSON_API);
    REQUIRE(report.results.at("search/discovered/2").category == Category::XML_API);
    REQUIRE_FALSE(report.results.at("search").api_hints.empty());
}
