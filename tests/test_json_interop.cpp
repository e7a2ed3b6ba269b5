#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "jpatch/json_interop.h"

using nlohmann::json;
using namespace jpatch;

// -----------------------------------------------------------------------
// Tests for nlohmann::json interop (jpatch/json_interop.h)
// -----------------------------------------------------------------------

TEST_CASE("Interop: import maps every JSON type", "[interop]")
{
    REQUIRE(import_json(json(nullptr)).is_null());
    REQUIRE(import_json(json(true)) == value(true));
    REQUIRE(import_json(json(-3)).get_number().is_integer());
    REQUIRE(import_json(json(3u)).get_number().is_unsigned());
    REQUIRE(import_json(json(2.5)).get_number().get_float() == 2.5);
    REQUIRE(import_json(json("hi")) == value("hi"));
    REQUIRE(import_json(json::array({1, "a"})) == value::array({1, "a"}));
    REQUIRE(import_json(json{{"k", {1, 2}}}) == value::object({{"k", value::array({1, 2})}}));
}

TEST_CASE("Interop: export then import preserves the document", "[interop]")
{
    json original = json::parse(R"({
        "name": "doc",
        "n": -12,
        "big": 18446744073709551615,
        "pi": 3.14159,
        "flags": [true, false, null],
        "nested": {"empty_obj": {}, "empty_arr": [], "s": "a/b~c"}
    })");
    value v = import_json(original);
    REQUIRE(export_json(v) == original);
    REQUIRE(import_json(export_json(v)) == v);
}

TEST_CASE("Interop: export keeps number kinds", "[interop]")
{
    REQUIRE(export_json(value(-1)).is_number_integer());
    REQUIRE(export_json(value::make_unsigned(5)).is_number_unsigned());
    REQUIRE(export_json(value(0.5)).is_number_float());
}

TEST_CASE("Interop: binary values are rejected", "[interop][error]")
{
    json bin = json::binary({0x01, 0x02});
    REQUIRE_THROWS_AS(import_json(bin), std::invalid_argument);
    REQUIRE_THROWS_AS(import_json(json{{"payload", bin}}), std::invalid_argument);
}

TEST_CASE("Interop: ADL hooks", "[interop]")
{
    value v = value::object({{"a", value::array({1, 2})}});
    json j = v;
    REQUIRE(j == json::parse(R"({"a": [1, 2]})"));
    REQUIRE(j.get<value>() == v);
}

// -----------------------------------------------------------------------
// Operation objects
// -----------------------------------------------------------------------

TEST_CASE("Interop: record_from_json reads all members", "[interop][operation]")
{
    operation_record rec = record_from_json(json::parse(
        R"({"op": "move", "from": "/a", "path": "/b", "extra": 1})"));
    REQUIRE(rec.op == "move");
    REQUIRE(rec.path == std::string("/b"));
    REQUIRE(rec.from == std::string("/a"));
    REQUIRE_FALSE(rec.value.has_value());

    operation_record with_null = record_from_json(json::parse(R"({"op": "add", "path": "/x", "value": null})"));
    REQUIRE(with_null.value.has_value());
    REQUIRE(with_null.value->is_null());
}

TEST_CASE("Interop: record_from_json leaves bad members absent", "[interop][operation]")
{
    SECTION("wrong-typed path") {
        operation_record rec = record_from_json(json::parse(R"({"op": "remove", "path": 5})"));
        REQUIRE_FALSE(rec.path.has_value());
        REQUIRE(validate(rec).error().kind == error_kind::missing_path);
    }
    SECTION("missing op") {
        operation_record rec = record_from_json(json::parse(R"({"path": "/a"})"));
        REQUIRE(rec.op.empty());
        REQUIRE(validate(rec).error().kind == error_kind::invalid_operation_kind);
    }
    SECTION("not an object") {
        operation_record rec = record_from_json(json::array({1, 2}));
        REQUIRE(rec.op.empty());
        REQUIRE_FALSE(rec.path.has_value());
    }
}

TEST_CASE("Interop: patch_from_json", "[interop][operation]")
{
    auto records = patch_from_json(json::parse(R"([
        {"op": "test", "path": "/a", "value": 1},
        {"op": "remove", "path": "/a"}
    ])"));
    REQUIRE(records.size() == 2u);
    REQUIRE(records[0].op == "test");
    REQUIRE(records[1].path == std::string("/a"));

    REQUIRE(patch_from_json(json::array()).empty());
    REQUIRE_THROWS_AS(patch_from_json(json::object()), std::invalid_argument);
}

TEST_CASE("Interop: operations write back to RFC 6902 objects", "[interop][operation]")
{
    REQUIRE(operation_to_json(ops::add("/a", 1)) == json::parse(R"({"op": "add", "path": "/a", "value": 1})"));
    REQUIRE(operation_to_json(ops::remove("/a")) == json::parse(R"({"op": "remove", "path": "/a"})"));
    REQUIRE(operation_to_json(ops::copy("/a", "/b")) ==
            json::parse(R"({"op": "copy", "from": "/a", "path": "/b"})"));

    json patch_text = json::parse(R"([
        {"op": "replace", "path": "/x", "value": [1, {"y": null}]},
        {"op": "move", "from": "/x", "path": "/z"}
    ])");
    std::vector<operation> typed;
    for (const operation_record& rec : patch_from_json(patch_text)) {
        typed.push_back(validate(rec).value());
    }
    REQUIRE(patch_to_json(typed) == patch_text);
}

// -----------------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------------

TEST_CASE("Interop: error_to_json", "[interop][error]")
{
    value d = import_json(json::parse(R"({"list": [1, 2]})"));

    SECTION("pointer error") {
        auto r = resolve_pointer(d, "/list/5");
        json j = error_to_json(r.error());
        REQUIRE(j["kind"] == "index_out_of_bounds");
        REQUIRE(j["pointer"] == "/list/5");
        REQUIRE(j["segment"] == "5");
        REQUIRE(j["index"] == 5);
        REQUIRE(j["length"] == 2);
        REQUIRE(j["current_path"] == json::array({"list", "5"}));
        REQUIRE_FALSE(j.contains("expected"));
    }
    SECTION("patch error") {
        auto r = apply_patch(d, std::vector<operation>{ops::add("/k", true), ops::test("/list/0", 9)});
        json j = error_to_json(r.error());
        REQUIRE(j["kind"] == "patch_aborted");
        REQUIRE(j["failed_index"] == 1);
        REQUIRE(j["applied"].size() == 1u);
        REQUIRE(j["remaining"].empty());
        REQUIRE(j["cause"]["kind"] == "test_failed");
        REQUIRE(j["cause"]["expected"] == 9);
        REQUIRE(j["cause"]["actual"] == 1);
        REQUIRE(j["last_document"] == json::parse(R"({"list": [1, 2], "k": true})"));
    }
}

// -----------------------------------------------------------------------
// RFC 6902 Appendix A, driven by JSON text
// -----------------------------------------------------------------------

namespace {

struct rfc_case {
    const char* name;
    const char* doc;
    const char* patch;
    const char* expected;   // nullptr: the patch must fail
};

const rfc_case rfc_cases[] = {
    {"A.1 adding an object member",
     R"({"foo": "bar"})",
     R"([{"op": "add", "path": "/baz", "value": "qux"}])",
     R"({"baz": "qux", "foo": "bar"})"},
    {"A.2 adding an array element",
     R"({"foo": ["bar", "baz"]})",
     R"([{"op": "add", "path": "/foo/1", "value": "qux"}])",
     R"({"foo": ["bar", "qux", "baz"]})"},
    {"A.3 removing an object member",
     R"({"baz": "qux", "foo": "bar"})",
     R"([{"op": "remove", "path": "/baz"}])",
     R"({"foo": "bar"})"},
    {"A.4 removing an array element",
     R"({"foo": ["bar", "qux", "baz"]})",
     R"([{"op": "remove", "path": "/foo/1"}])",
     R"({"foo": ["bar", "baz"]})"},
    {"A.5 replacing a value",
     R"({"baz": "qux", "foo": "bar"})",
     R"([{"op": "replace", "path": "/baz", "value": "boo"}])",
     R"({"baz": "boo", "foo": "bar"})"},
    {"A.6 moving a value",
     R"({"foo": {"bar": "baz", "waldo": "fred"}, "qux": {"corge": "grault"}})",
     R"([{"op": "move", "from": "/foo/waldo", "path": "/qux/thud"}])",
     R"({"foo": {"bar": "baz"}, "qux": {"corge": "grault", "thud": "fred"}})"},
    {"A.7 moving an array element",
     R"({"foo": ["all", "grass", "cows", "eat"]})",
     R"([{"op": "move", "from": "/foo/1", "path": "/foo/3"}])",
     R"({"foo": ["all", "cows", "eat", "grass"]})"},
    {"A.8 testing a value: success",
     R"({"baz": "qux", "foo": ["a", 2, "c"]})",
     R"([{"op": "test", "path": "/baz", "value": "qux"}, {"op": "test", "path": "/foo/1", "value": 2}])",
     R"({"baz": "qux", "foo": ["a", 2, "c"]})"},
    {"A.9 testing a value: error",
     R"({"baz": "qux"})",
     R"([{"op": "test", "path": "/baz", "value": "bar"}])",
     nullptr},
    {"A.10 adding a nested member object",
     R"({"foo": "bar"})",
     R"([{"op": "add", "path": "/child", "value": {"grandchild": {}}}])",
     R"({"foo": "bar", "child": {"grandchild": {}}})"},
    {"A.11 ignoring unrecognized elements",
     R"({"foo": "bar"})",
     R"([{"op": "add", "path": "/baz", "value": "qux", "xyz": 123}])",
     R"({"foo": "bar", "baz": "qux"})"},
    {"A.12 adding to a nonexistent target",
     R"({"foo": "bar"})",
     R"([{"op": "add", "path": "/baz/bat", "value": "qux"}])",
     // parents are created on the way down
     R"({"foo": "bar", "baz": {"bat": "qux"}})"},
    {"A.14 ~ escape ordering",
     R"({"/": 9, "~1": 10})",
     R"([{"op": "test", "path": "/~01", "value": 10}])",
     R"({"/": 9, "~1": 10})"},
    {"A.15 comparing strings and numbers",
     R"({"/": 9, "~1": 10})",
     R"([{"op": "test", "path": "/~01", "value": "10"}])",
     nullptr},
    {"A.16 adding an array value",
     R"({"foo": ["bar"]})",
     R"([{"op": "add", "path": "/foo/-", "value": ["abc", "def"]}])",
     R"({"foo": ["bar", ["abc", "def"]]})"},
};

} // namespace

TEST_CASE("Interop: RFC 6902 appendix examples", "[interop][rfc6902]")
{
    for (const rfc_case& c : rfc_cases) {
        INFO(c.name);
        value doc = import_json(json::parse(c.doc));
        auto result = apply_patch(doc, patch_from_json(json::parse(c.patch)));
        if (c.expected) {
            REQUIRE(result.ok());
            REQUIRE(export_json(result.value()) == json::parse(c.expected));
        } else {
            REQUIRE_FALSE(result.ok());
            REQUIRE(result.error().cause.kind == error_kind::test_failed);
            REQUIRE(result.error().last_document == doc);
        }
    }
}
