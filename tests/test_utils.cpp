// tests/test_utils.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentorch/utils/template_renderer.h"
#include "agentorch/utils/value_merge.h"
#include "agentorch/utils/yaml_json.h"

using namespace agentorch;

TEST_CASE("Template rendering", "[utils][template]") {
    Value data = {{"name", "Ada"}, {"items", {1, 2, 3}}};
    REQUIRE(InjaTemplateRenderer::render("Hello {{ name }}", data) == "Hello Ada");
    REQUIRE(InjaTemplateRenderer::render("{{ length(items) }}", data) == "3");
    REQUIRE_THROWS_AS(InjaTemplateRenderer::render("{{ missing.value }}", data), std::runtime_error);
}

TEST_CASE("Template includes are disabled", "[utils][template]") {
    REQUIRE_THROWS(InjaTemplateRenderer::render("{% include \"/etc/passwd\" %}", Value::object()));
}

TEST_CASE("Condition evaluation", "[utils][template]") {
    Value data = {{"score", 7}, {"label", "ok"}, {"flag", false}};
    REQUIRE(evaluate_condition("score > 5", data));
    REQUIRE_FALSE(evaluate_condition("score > 10", data));
    REQUIRE(evaluate_condition("label == \"ok\"", data));
    REQUIRE_FALSE(evaluate_condition("flag", data));
    REQUIRE(evaluate_condition("score", data));
    REQUIRE_THROWS(evaluate_condition("label", data));
}

TEST_CASE("Truthiness", "[utils]") {
    REQUIRE_FALSE(is_truthy(Value()));
    REQUIRE_FALSE(is_truthy(Value(0)));
    REQUIRE_FALSE(is_truthy(Value("false")));
    REQUIRE_FALSE(is_truthy(Value::object()));
    REQUIRE(is_truthy(Value("yes")));
    REQUIRE(is_truthy(Value{{"a", 1}}));
}

TEST_CASE("Merge strategies", "[utils][merge]") {
    SECTION("deep_merge recurses into objects") {
        Value target = {{"a", {{"x", 1}}}, {"keep", true}};
        merge_values(target, {{"a", {{"y", 2}}}});
        REQUIRE(target == Value{{"a", {{"x", 1}, {"y", 2}}}, {"keep", true}});
    }
    SECTION("error_on_conflict throws on differing scalars") {
        Value target = {{"a", 1}};
        MergePolicy policy;
        policy.default_strategy = "error_on_conflict";
        REQUIRE_NOTHROW(merge_values(target, {{"a", 1}}, policy));
        REQUIRE_THROWS_AS(merge_values(target, {{"a", 2}}, policy), std::runtime_error);
    }
    SECTION("array_concat appends") {
        Value target = {{"list", {1}}};
        MergePolicy policy;
        policy.default_strategy = "array_concat";
        merge_values(target, {{"list", {2, 3}}}, policy);
        REQUIRE(target["list"] == Value{1, 2, 3});
    }
    SECTION("field policies override the default") {
        Value target = {{"tags", {"a"}}, {"n", 1}};
        MergePolicy policy;
        policy.default_strategy = "last_write_wins";
        policy.field_policies["tags"] = "array_merge_unique";
        merge_values(target, {{"tags", {"a", "b"}}, {"n", 2}}, policy);
        REQUIRE(target["tags"] == Value{"a", "b"});
        REQUIRE(target["n"] == 2);
    }
    SECTION("unknown strategy is rejected") {
        Value target = {{"n", 1}};
        MergePolicy policy;
        policy.default_strategy = "coin_flip";
        REQUIRE_FALSE(is_known_merge_strategy("coin_flip"));
        REQUIRE_THROWS(merge_values(target, {{"n", 2}}, policy));
    }
}

TEST_CASE("as_object wraps non-object values", "[utils]") {
    REQUIRE(as_object(Value()) == Value::object());
    REQUIRE(as_object(Value(3)) == Value{{"input", 3}});
    REQUIRE(as_object(Value{{"k", "v"}}) == Value{{"k", "v"}});
}

TEST_CASE("YAML to JSON conversion", "[utils][yaml]") {
    YAML::Node node = YAML::Load(R"(
count: 3
ratio: 0.5
enabled: true
quoted: "42"
nothing: ~
list: [a, 1]
)");
    Value j = yaml_to_json(node);
    REQUIRE(j["count"] == 3);
    REQUIRE(j["ratio"] == 0.5);
    REQUIRE(j["enabled"] == true);
    REQUIRE(j["quoted"] == "42");
    REQUIRE(j["nothing"].is_null());
    REQUIRE(j["list"] == Value{"a", 1});
}
