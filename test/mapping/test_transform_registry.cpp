#include <catch2/catch_test_macros.hpp>

#include <docfed/mapping/transform_registry.hpp>

#include <algorithm>

using namespace docfed;

TEST_CASE("TransformRegistry: case transforms and their aliases", "[mapping][transform]") {
    TransformRegistry registry;
    CHECK(registry.Apply("toUpperCase", Value("ann")) == Value("ANN"));
    CHECK(registry.Apply("uppercase", Value("ann")) == Value("ANN"));
    CHECK(registry.Apply("toLowerCase", Value("ANN")) == Value("ann"));
    CHECK(registry.Apply("lowercase", Value("Ann")) == Value("ann"));
}

TEST_CASE("TransformRegistry: trim", "[mapping][transform]") {
    TransformRegistry registry;
    CHECK(registry.Apply("trim", Value("  a b \t")) == Value("a b"));
    CHECK(registry.Apply("trim", Value("   ")) == Value(""));
}

TEST_CASE("TransformRegistry: toNumber", "[mapping][transform]") {
    TransformRegistry registry;
    CHECK(registry.Apply("toNumber", Value("42")) == Value(42));
    CHECK(registry.Apply("to-number", Value(" 1.5 ")) == Value(1.5));
    CHECK(registry.Apply("toNumber", Value(true)) == Value(1));
    CHECK(registry.Apply("toNumber", Value("n/a")) == Value("n/a"));
}

TEST_CASE("TransformRegistry: toString", "[mapping][transform]") {
    TransformRegistry registry;
    CHECK(registry.Apply("toString", Value(7)) == Value("7"));
    CHECK(registry.Apply("to-string", Value(false)) == Value("false"));
    CHECK(registry.Apply("toString", Value()).IsNull());
}

TEST_CASE("TransformRegistry: toDate from ISO text and epoch millis", "[mapping][transform]") {
    TransformRegistry registry;
    auto from_text = registry.Apply("toDate", Value("2023-05-15"));
    REQUIRE(from_text.IsTimestamp());
    CHECK(FormatTimestamp(from_text.AsTimestamp()) == "2023-05-15T00:00:00.000Z");

    auto from_millis = registry.Apply("to-date", Value(1000));
    REQUIRE(from_millis.IsTimestamp());
    CHECK(from_millis.AsTimestamp().millis == 1000);

    CHECK(registry.Apply("toDate", Value("yesterday")) == Value("yesterday"));
}

TEST_CASE("TransformRegistry: toDate leaves out-of-range millis unchanged", "[mapping][transform]") {
    TransformRegistry registry;
    CHECK(registry.Apply("toDate", Value(1e300)) == Value(1e300));
    CHECK(registry.Apply("toDate", Value(-1e300)) == Value(-1e300));
    CHECK(registry.Apply("toDate", Value(9.3e18)) == Value(9.3e18));

    auto negative = registry.Apply("toDate", Value(-1000));
    REQUIRE(negative.IsTimestamp());
    CHECK(negative.AsTimestamp().millis == -1000);
}

TEST_CASE("TransformRegistry: string transforms leave other kinds alone", "[mapping][transform]") {
    TransformRegistry registry;
    CHECK(registry.Apply("toUpperCase", Value(3)) == Value(3));
    CHECK(registry.Apply("trim", Value()).IsNull());
}

TEST_CASE("TransformRegistry: unknown name returns the value and reports it", "[mapping][transform]") {
    TransformRegistry registry;
    bool found = true;
    CHECK(registry.Apply("reverse", Value("abc"), &found) == Value("abc"));
    CHECK_FALSE(found);

    registry.Apply("trim", Value("x"), &found);
    CHECK(found);
}

TEST_CASE("TransformRegistry: Register adds and replaces", "[mapping][transform]") {
    TransformRegistry registry;
    CHECK_FALSE(registry.Has("double"));
    registry.Register("double", [](const Value& v) {
        return v.IsNumber() ? Value(v.AsNumber() * 2) : v;
    });
    CHECK(registry.Has("double"));
    CHECK(registry.Apply("double", Value(4)) == Value(8));

    registry.Register("trim", [](const Value&) { return Value("replaced"); });
    CHECK(registry.Apply("trim", Value(" x ")) == Value("replaced"));
}

TEST_CASE("TransformRegistry: Names is sorted and lists the built-ins", "[mapping][transform]") {
    auto names = TransformRegistry().Names();
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(names.size() == 11);
    CHECK(std::find(names.begin(), names.end(), "to-date") != names.end());
}
