#include "httplib.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace httplib;

// Local endpoints covering every classification outcome.
// Used by the [.live] tests and by config/fixture_catalog.json.

static int port_from_env() {
  const char* p = std::getenv("FIXTURE_PORT");
  if (!p || !*p) return 8080;
  char* end = nullptr;
  long v = std::strtol(p, &end, 10);
  if (*end != '\0' || v <= 0 || v > 65535) return 8080;
  return static_cast<int>(v);
}

int main() {
  Server svr;

  svr.Get("/healthz", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/api/patents", [](const Request& req, Response& res) {
    std::string q = req.has_param("q") ? req.get_param_value("q") : "";
    std::string body = "{\"query\":\"" + q + "\",\"count\":2,"
                       "\"patents\":[{\"number\":\"US10000000\"},{\"number\":\"US10000001\"}]}";
    res.status = 200;
    res.set_content(body, "application/json");
  });

  svr.Get("/api/broken", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("{\"patents\": [1, 2,", "application/json");
  });

  svr.Get("/xml/status", [](const Request&, Response& res) {
    const char* x = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                    "<caseStatus><serial>88123456</serial><state>LIVE</state></caseStatus>\n";
    res.status = 200;
    res.set_content(x, "application/xml");
  });

  svr.Get("/xml/broken", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("<caseStatus><serial>88123456</caseStatus>", "text/xml");
  });

  // Well-formed XML behind an unhelpful content type
  svr.Get("/xml/plain", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("<results><item id=\"1\"/></results>", "text/plain");
  });

  svr.Get("/private", [](const Request&, Response& res) {
    res.status = 403;
    res.set_content("Forbidden", "text/plain");
  });

  svr.Get("/login-required", [](const Request&, Response& res) {
    res.status = 401;
    res.set_header("WWW-Authenticate", "Basic realm=\"fixture\"");
    res.set_content("Unauthorized", "text/plain");
  });

  svr.Get("/search", [](const Request&, Response& res) {
    const char* html =
      "<!doctype html><html><head><title>Patent search</title>"
      "<script>var endpoints = {list: \"/api/patents?q=\", lookup: \"/api/search/lookup\"};</script>"
      "</head><body>"
      "<h1>Search</h1>"
      "<form action=\"/api/patents\" method=\"get\"><input name=\"q\"><button>Go</button></form>"
      "<form action=\"/xml/status\" method=\"get\"><input name=\"serial\"></form>"
      "<form action=\"//elsewhere.example/collect\" method=\"post\"><input name=\"email\"></form>"
      "<p><a href=\"/healthz\">health</a></p>"
      "</body></html>";
    res.status = 200;
    res.set_content(html, "text/html; charset=utf-8");
  });

  // Bulk data listing with a form that posts its search
  svr.Get("/bulk", [](const Request&, Response& res) {
    const char* html =
      "<!doctype html><html><body><h1>Bulk data</h1>"
      "<form action=\"/api/submit\" method=\"post\"><input name=\"q\" value=\"solar\"></form>"
      "<ul><li><a href=\"/files/grants_2024.zip\">Grants 2024</a></li>"
      "<li><a href=\"/xml/status\">Status</a></li>"
      "<li><a href=\"/files/index.json\">Index</a></li></ul>"
      "</body></html>";
    res.status = 200;
    res.set_content(html, "text/html; charset=utf-8");
  });

  svr.Post("/api/submit", [](const Request& req, Response& res) {
    std::string q = req.has_param("q") ? req.get_param_value("q") : "";
    res.status = 200;
    res.set_content("{\"query\":\"" + q + "\",\"results\":[]}", "application/json");
  });

  svr.Get("/slow", [](const Request& req, Response& res) {
    int seconds = 20;
    if (req.has_param("s")) {
      seconds = std::atoi(req.get_param_value("s").c_str());
    }
    std::this_thread::sleep_for(std::chrono::seconds(seconds));
    res.status = 200;
    res.set_content("{\"slow\":true}", "application/json");
  });

  svr.Get("/redirect", [](const Request&, Response& res) {
    res.set_redirect("/api/patents");
  });

  int port = port_from_env();
  std::cout << "Attempting to bind to http://127.0.0.1:" << port << "\n";
  if (!svr.bind_to_port("127.0.0.1", port)) {
    std::fprintf(stderr, "ERROR: failed to bind 127.0.0.1:%d\n", port);
    return 1;
  }
  std::cout << "Listening for requests...\n";
  svr.listen_after_bind();
  return 0;
}
