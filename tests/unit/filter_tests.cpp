#include <doctest/doctest.h>
#include <polcanon/filter.hpp>

using namespace polcanon;

namespace {

Document load(const std::string& yaml) {
    auto parsed = parse_document(yaml);
    REQUIRE(parsed.ok);
    return parsed.value;
}

} // namespace

// ============================================================================
// Rule Kinds
// ============================================================================

TEST_CASE("parse_rule_kind round-trips rule_kind_to_string") {
    for (auto kind : {RuleKind::Delete, RuleKind::Elements, RuleKind::Members,
                      RuleKind::RenameKeys, RuleKind::ReplaceValues}) {
        auto parsed = parse_rule_kind(rule_kind_to_string(kind));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == kind);
    }
    CHECK_FALSE(parse_rule_kind("drop").has_value());
}

// ============================================================================
// Delete
// ============================================================================

TEST_CASE("delete removes a field and skips missing ones") {
    auto doc = load("id: abc\nname: test\n");
    auto result = apply_rules(doc, {delete_rule("id"), delete_rule("revision")});
    CHECK(result.ok);
    CHECK_FALSE(doc.get("id").found());
    CHECK(doc.get("name").found());
}

TEST_CASE("delete through a scalar is a shape error") {
    auto doc = load("agent: disabled\n");
    auto result = apply_rules(doc, {delete_rule("agent.protection.signing_key")});
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("expected map") != std::string::npos);
}

TEST_CASE("delete only if empty honours ignorable values") {
    auto rule = delete_if_empty_rule("namespaces", {Value("default")});

    SUBCASE("only ignorable values") {
        auto doc = load("namespaces: [default]\n");
        CHECK(apply_rules(doc, {rule}).ok);
        CHECK_FALSE(doc.get("namespaces").found());
    }
    SUBCASE("empty list") {
        auto doc = load("namespaces: []\n");
        CHECK(apply_rules(doc, {rule}).ok);
        CHECK_FALSE(doc.get("namespaces").found());
    }
    SUBCASE("null") {
        auto doc = load("namespaces:\n");
        CHECK(apply_rules(doc, {rule}).ok);
        CHECK_FALSE(doc.get("namespaces").found());
    }
    SUBCASE("other values are kept") {
        auto doc = load("namespaces: [default, team-a]\n");
        CHECK(apply_rules(doc, {rule}).ok);
        REQUIRE(doc.get("namespaces").found());
        CHECK(doc.get("namespaces").value->size() == 2);
    }
    SUBCASE("a scalar is never empty") {
        auto doc = load("namespaces: default\n");
        CHECK(apply_rules(doc, {rule}).ok);
        CHECK(doc.get("namespaces").found());
    }
}

TEST_CASE("is_empty_value") {
    CHECK(is_empty_value(Value(), {}));
    CHECK(is_empty_value(Value::object(), {}));
    CHECK(is_empty_value(Value::array(), {}));
    CHECK(is_empty_value(Value::array({"default", "default"}), {Value("default")}));
    CHECK_FALSE(is_empty_value(Value::array({"default"}), {}));
    CHECK_FALSE(is_empty_value(Value{{"a", 1}}, {}));
    CHECK_FALSE(is_empty_value(Value(""), {}));
    CHECK_FALSE(is_empty_value(Value(0), {}));
}

// ============================================================================
// Elements
// ============================================================================

TEST_CASE("elements applies nested rules to every list element") {
    auto doc = load(R"(
inputs:
  - id: a
    name: one
    streams:
      - id: s1
        period: 10s
  - id: b
    name: two
)");
    auto result = apply_rules(doc, {
        elements_rule("inputs", {
            delete_rule("id"),
            elements_rule("streams", {delete_rule("id")}),
        }),
    });
    REQUIRE(result.ok);

    const auto& inputs = doc.root()["inputs"];
    REQUIRE(inputs.size() == 2);
    CHECK_FALSE(inputs[0].contains("id"));
    CHECK_FALSE(inputs[1].contains("id"));
    CHECK(inputs[0]["name"] == "one");
    CHECK_FALSE(inputs[0]["streams"][0].contains("id"));
    CHECK(inputs[0]["streams"][0]["period"] == "10s");
}

TEST_CASE("elements requires a list of maps") {
    SUBCASE("not a list") {
        auto doc = load("inputs: oops\n");
        auto result = apply_rules(doc, {elements_rule("inputs", {delete_rule("id")})});
        CHECK_FALSE(result.ok);
        CHECK(result.error == "inputs: expected list, found string");
    }
    SUBCASE("element not a map") {
        auto doc = load("inputs: [1]\n");
        auto result = apply_rules(doc, {elements_rule("inputs", {delete_rule("id")})});
        CHECK_FALSE(result.ok);
        CHECK(result.error == "inputs: expected map in list element 0, found integer");
    }
    SUBCASE("missing list is skipped") {
        auto doc = load("name: x\n");
        CHECK(apply_rules(doc, {elements_rule("inputs", {delete_rule("id")})}).ok);
    }
}

// ============================================================================
// Members
// ============================================================================

TEST_CASE("members applies nested rules to every map value") {
    auto doc = load(R"(
exporters:
  elasticsearch/componentid-0:
    endpoints: [https://a:9200]
    user: x
  debug/componentid-1:
  otlp/componentid-2:
    endpoint: collector:4317
)");
    auto result = apply_rules(doc, {members_rule("exporters", {delete_rule("user")})});
    REQUIRE(result.ok);
    CHECK_FALSE(doc.root()["exporters"]["elasticsearch/componentid-0"].contains("user"));
    CHECK(doc.root()["exporters"]["debug/componentid-1"].is_null());
}

TEST_CASE("members rejects non-map values") {
    auto doc = load("exporters:\n  a/b: 1\n");
    auto result = apply_rules(doc, {members_rule("exporters", {delete_rule("user")})});
    CHECK_FALSE(result.ok);
    CHECK(result.error == "exporters.a/b: expected map, found integer");
}

TEST_CASE("members skips a null map") {
    auto doc = load("exporters: ~\n");
    auto result = apply_rules(doc, {members_rule("exporters", {delete_rule("user")})});
    CHECK(result.ok);
    CHECK(doc.root()["exporters"].is_null());
}

// ============================================================================
// RenameKeys
// ============================================================================

TEST_CASE("rename keys leaves very long keys alone") {
    const std::string long_key(MAX_RENAMED_KEY_LENGTH + 1, 'a');
    Document doc(Value{{"m", {{long_key, 1}, {"abcd-efgh", 2}}}});
    auto result = apply_rules(doc, {rename_keys_rule("m", "^[a-z0-9]{4,}(-[a-z0-9]{4,})*$", "x")});
    REQUIRE(result.ok);
    CHECK(doc.root()["m"].contains(long_key));
    CHECK(doc.root()["m"]["x"] == 2);
}

TEST_CASE("rename keys replaces matching keys") {
    auto doc = load(R"(
output_permissions:
  default:
    _elastic_agent_checks: {cluster: [monitor]}
    1e4954ce-af37-4731-9f4a-407b08e69e42: {indices: []}
)");
    auto result = apply_rules(doc, {
        rename_keys_rule("output_permissions.default", "^[a-z0-9]{4,}(-[a-z0-9]{4,})+$",
                         PERMISSIONS_KEY_PLACEHOLDER),
    });
    REQUIRE(result.ok);
    const auto& perms = doc.root()["output_permissions"]["default"];
    CHECK(perms.contains(PERMISSIONS_KEY_PLACEHOLDER));
    CHECK(perms.contains("_elastic_agent_checks"));
    CHECK(perms.size() == 2);
}

TEST_CASE("rename keys uses capture groups") {
    auto doc = load("m:\n  old-a: 1\n  keep: 2\n");
    auto result = apply_rules(doc, {rename_keys_rule("m", "^old-(.*)$", "new-$1")});
    REQUIRE(result.ok);
    CHECK(doc.root()["m"]["new-a"] == 1);
    CHECK(doc.root()["m"]["keep"] == 2);
}

TEST_CASE("rename keys collapsing onto one key keeps the first") {
    auto doc = load("m:\n  abcd-efgh: 1\n  ijkl-mnop: 2\n");
    auto result = apply_rules(doc, {rename_keys_rule("m", "^[a-z0-9]{4,}(-[a-z0-9]{4,})+$", "x")});
    REQUIRE(result.ok);
    CHECK(doc.root()["m"].size() == 1);
    CHECK(doc.root()["m"]["x"] == 1);
}

TEST_CASE("rename keys on a list is a shape error") {
    auto doc = load("m: [a]\n");
    auto result = apply_rules(doc, {rename_keys_rule("m", "a", "b")});
    CHECK_FALSE(result.ok);
    CHECK(result.error == "m: expected map, found list");
}

TEST_CASE("rename keys with an invalid pattern fails when applied") {
    auto rule = rename_keys_rule("m", "([", "x");
    CHECK(rule.regex == nullptr);

    auto doc = load("m:\n  a: 1\n");
    auto result = apply_rules(doc, {rule});
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("invalid key pattern") != std::string::npos);
}

// ============================================================================
// ReplaceValues
// ============================================================================

TEST_CASE("replace values rewrites scalars and lists of scalars") {
    auto doc = load("one: https://a:9200\nmany: [https://a:9200, https://b:9200]\n");
    auto result = apply_rules(doc, {
        replace_values_rule("one", ENDPOINT_PLACEHOLDER),
        replace_values_rule("many", ENDPOINT_PLACEHOLDER),
    });
    REQUIRE(result.ok);
    CHECK(doc.root()["one"] == ENDPOINT_PLACEHOLDER);
    CHECK(doc.root()["many"] == Value::array({ENDPOINT_PLACEHOLDER, ENDPOINT_PLACEHOLDER}));
}

TEST_CASE("replace values rejects maps") {
    auto doc = load("one:\n  a: 1\n");
    auto result = apply_rules(doc, {replace_values_rule("one", "x")});
    CHECK_FALSE(result.ok);
    CHECK(result.error == "one: expected scalar or list, found map");
}

// ============================================================================
// Policy Rule Table
// ============================================================================

TEST_CASE("policy rule table removes generated fields") {
    auto doc = load(R"(
id: 8c2b5e2a
revision: 3
agent:
  protection:
    signing_key: abc
fleet:
  hosts: [https://fleet:8220]
outputs:
  default: {type: elasticsearch}
signed:
  data: xyz
namespaces: [default]
secret_references:
  - id: s1
inputs:
  - id: logfile-1
    package_policy_id: p1
    revision: 2
    meta:
      package:
        name: system
        version: 1.2.3
    streams:
      - id: stream-1
        data_stream:
          type: logs
          dataset: system.syslog
          elasticsearch:
            dynamic_dataset: true
            dynamic_namespace: true
name: system-1
)");
    auto result = apply_rules(doc, policy_rule_table());
    REQUIRE(result.ok);

    for (const char* path : {"id", "revision", "agent", "fleet", "outputs", "signed", "namespaces"}) {
        CHECK_MESSAGE(!doc.get(path).found(), path);
    }
    CHECK(doc.root()["secret_references"][0].empty());

    const auto& input = doc.root()["inputs"][0];
    CHECK_FALSE(input.contains("id"));
    CHECK_FALSE(input.contains("package_policy_id"));
    CHECK_FALSE(input.contains("revision"));
    CHECK(input["meta"]["package"]["name"] == "system");
    CHECK_FALSE(input["meta"]["package"].contains("version"));

    const auto& stream = input["streams"][0];
    CHECK_FALSE(stream.contains("id"));
    CHECK(stream["data_stream"]["dataset"] == "system.syslog");
    CHECK_FALSE(stream["data_stream"].contains("type"));
    CHECK_FALSE(stream["data_stream"].contains("elasticsearch"));

    CHECK(doc.root()["name"] == "system-1");
}

TEST_CASE("policy rule table keeps non-default namespaces") {
    auto doc = load("namespaces: [default, production]\n");
    REQUIRE(apply_rules(doc, policy_rule_table()).ok);
    CHECK(doc.get("namespaces").found());
}

TEST_CASE("policy rule table keeps other elasticsearch stream settings") {
    auto doc = load(R"(
inputs:
  - streams:
      - data_stream:
          elasticsearch:
            dynamic_dataset: true
            index_mode: time_series
)");
    REQUIRE(apply_rules(doc, policy_rule_table()).ok);
    const auto& es = doc.root()["inputs"][0]["streams"][0]["data_stream"]["elasticsearch"];
    CHECK(es.size() == 1);
    CHECK(es["index_mode"] == "time_series");
}

TEST_CASE("rules_to_json describes every rule") {
    auto j = rules_to_json(policy_rule_table());
    REQUIRE(j.is_array());
    CHECK(j.size() == policy_rule_table().size());
    CHECK(j[0]["kind"] == "delete");
    CHECK(j[0]["path"] == "id");

    bool found_rename = false;
    for (const auto& rule : j) {
        if (rule["kind"] == "rename_keys") {
            found_rename = true;
            CHECK(rule["replacement"] == PERMISSIONS_KEY_PLACEHOLDER);
        }
    }
    CHECK(found_rename);
}
