#include <doctest/doctest.h>
#include <polcanon/component_ids.hpp>

#include <string>

using namespace polcanon;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("component headers are renamed and references follow") {
    const std::string policy = R"(receivers:
  httpcheck/4391d954-1ffe-4014-a256-5eda78a71828:
    targets:
      - endpoint: http://localhost
exporters:
  elasticsearch/default:
    endpoints: [https://localhost:9200]
service:
  pipelines:
    metrics/abc:
      receivers: [httpcheck/4391d954-1ffe-4014-a256-5eda78a71828]
      exporters:
        - elasticsearch/default
)";
    auto result = canonicalize_component_ids(policy);

    CHECK(contains(result.text, "  httpcheck/componentid-0:\n"));
    CHECK(contains(result.text, "  elasticsearch/componentid-0:\n"));
    CHECK(contains(result.text, "    metrics/componentid-0:\n"));
    CHECK(contains(result.text, "receivers: [httpcheck/componentid-0]"));
    CHECK(contains(result.text, "- elasticsearch/componentid-0"));
    CHECK_FALSE(contains(result.text, "4391d954"));
    CHECK_FALSE(contains(result.text, "elasticsearch/default"));

    CHECK(result.headers_rewritten == 3);
    CHECK(result.identities.at("httpcheck/4391d954-1ffe-4014-a256-5eda78a71828") ==
          "httpcheck/componentid-0");
    CHECK(result.identities.at("metrics/abc") == "metrics/componentid-0");
}

TEST_CASE("numbering restarts in every section") {
    auto result = canonicalize_component_ids(R"(receivers:
  otlp/a:
    protocols: {}
  otlp/b: {}
processors:
  batch/x: {}
)");
    CHECK(result.identities.at("otlp/a") == "otlp/componentid-0");
    CHECK(result.identities.at("otlp/b") == "otlp/componentid-1");
    CHECK(result.identities.at("batch/x") == "batch/componentid-0");
    CHECK(contains(result.text, "  otlp/componentid-1: {}"));
}

TEST_CASE("components are numbered by type, then declaration order") {
    auto result = canonicalize_component_ids(R"(receivers:
  zipkin/one: {}
  httpcheck/two: {}
  zipkin/three: {}
)");
    CHECK(result.identities.at("httpcheck/two") == "httpcheck/componentid-0");
    CHECK(result.identities.at("zipkin/one") == "zipkin/componentid-1");
    CHECK(result.identities.at("zipkin/three") == "zipkin/componentid-2");
}

TEST_CASE("rewriting is a fixed point") {
    const std::string policy = R"(receivers:
  zipkin/one: {}
  httpcheck/two: {}
service:
  pipelines:
    traces/x:
      receivers: [zipkin/one, httpcheck/two]
)";
    auto once = canonicalize_component_ids(policy);
    auto twice = canonicalize_component_ids(once.text);
    CHECK(twice.text == once.text);
}

TEST_CASE("references are replaced as whole tokens") {
    auto result = canonicalize_component_ids(R"(receivers:
  httpcheck/abc: {}
  httpcheck/abc-routing: {}
service:
  pipelines:
    logs/p:
      receivers: [httpcheck/abc, httpcheck/abc-routing]
)");
    CHECK(contains(result.text, "receivers: [httpcheck/componentid-0, httpcheck/componentid-1]"));
    CHECK_FALSE(contains(result.text, "componentid-0-routing"));
}

TEST_CASE("replacements do not chain") {
    // After renaming, "a/componentid-0" must not be rewritten again even if it
    // is itself an original identifier.
    auto result = canonicalize_component_ids(R"(receivers:
  a/x: {}
  a/componentid-0: {}
service:
  pipelines:
    logs/p:
      receivers: [a/x, a/componentid-0]
)");
    CHECK(result.identities.at("a/x") == "a/componentid-0");
    CHECK(result.identities.at("a/componentid-0") == "a/componentid-1");
    CHECK(contains(result.text, "receivers: [a/componentid-0, a/componentid-1]"));
}

TEST_CASE("empty sections and other top-level keys are left alone") {
    const std::string policy = R"(extensions: {}
inputs:
  - id: logfile/abc
    type: logfile
outputs:
  default/x:
    type: elasticsearch
)";
    auto result = canonicalize_component_ids(policy);
    CHECK(result.text == policy);
    CHECK(result.identities.empty());
    CHECK(result.headers_rewritten == 0);
}

TEST_CASE("text without component sections is unchanged") {
    const std::string policy = "id: abc\nrevision: 2\n";
    auto result = canonicalize_component_ids(policy);
    CHECK(result.text == policy);
}

TEST_CASE("component_sections lists the component blocks") {
    const auto& sections = component_sections();
    CHECK(sections.size() == 6);
    CHECK(sections.front() == "extensions");
    CHECK(sections.back() == "service");
}

TEST_CASE("keys below a component keep their names") {
    const std::string policy = R"(receivers:
  zz/a:
    x/nested1:
      k: 1
  x/b:
    k: 2
)";
    auto once = canonicalize_component_ids(policy);
    CHECK(once.identities.at("x/b") == "x/componentid-0");
    CHECK(once.identities.at("zz/a") == "zz/componentid-1");
    CHECK(once.identities.count("x/nested1") == 0);
    CHECK(contains(once.text, "    x/nested1:\n"));
    CHECK(once.headers_rewritten == 2);

    // Same policy with the component keys in sorted order, as written back.
    const std::string sorted = R"(receivers:
  x/componentid-0:
    k: 2
  zz/componentid-1:
    x/nested1:
      k: 1
)";
    auto twice = canonicalize_component_ids(sorted);
    CHECK(twice.text == sorted);
}

TEST_CASE("only pipelines are renamed inside service") {
    auto result = canonicalize_component_ids(R"(service:
  extensions: [health_check/x]
  pipelines:
    logs/a:
      receivers: [filelog/b]
  telemetry:
    metrics/level:
      detail: basic
)");
    CHECK(result.identities.at("logs/a") == "logs/componentid-0");
    CHECK(result.identities.count("metrics/level") == 0);
    CHECK(contains(result.text, "    metrics/level:\n"));
    CHECK(result.headers_rewritten == 1);
}

TEST_CASE("very long lines inside a component block") {
    const std::string certificate(1 << 20, 'A');
    const std::string policy = "receivers:\n  filelog/abc:\n    ca: |\n      " + certificate +
                               "\n    key: " + certificate + "/" + certificate + ":\n";
    auto result = canonicalize_component_ids(policy);
    CHECK(result.identities.at("filelog/abc") == "filelog/componentid-0");
    CHECK(result.headers_rewritten == 1);
    CHECK(result.text.size() == policy.size() - std::string("abc").size() +
                                    std::string("componentid-0").size());
}

TEST_CASE("section openers must stand alone on their line") {
    const std::string policy = "receivers: {otlp/a: {}}\nreceiversx:\n  otlp/b: {}\n";
    auto result = canonicalize_component_ids(policy);
    CHECK(result.text == policy);
    CHECK(result.identities.empty());
}
