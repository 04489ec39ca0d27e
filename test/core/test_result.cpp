#include <catch2/catch_test_macros.hpp>

#include <docfed/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace docfed;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-only value", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
    REQUIRE(r.IsOk());
    auto ptr = std::move(r).Value();
    REQUIRE(ptr);
    CHECK(*ptr == 7);
}

TEST_CASE("Result: same type for value and error", "[result]") {
    auto ok = Result<std::string, std::string>::Ok("value");
    auto err = Result<std::string, std::string>::Err("error");
    CHECK(ok.IsOk());
    CHECK(ok.Value() == "value");
    CHECK(err.IsErr());
    CHECK(err.Error() == "error");
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString includes operation, target, message and detail", "[result][error]") {
    auto e = Error::Make(ErrorCategory::Syntax, "ParseQuery", "SELEC x", "Query must start with SELECT",
                         "line 1, column 1");
    CHECK(e.ToString() ==
          "ParseQuery [SELEC x]: Query must start with SELECT (line 1, column 1)");
}

TEST_CASE("Error: ToString omits empty target and detail", "[result][error]") {
    auto e = Error::Make(ErrorCategory::Internal, "Run", "", "boom");
    CHECK(e.ToString() == "Run: boom");
}

TEST_CASE("Error: exit codes follow the category", "[result][error]") {
    auto code = [](ErrorCategory c) { return Error::Make(c, "op", "", "m").ExitCode(); };
    CHECK(code(ErrorCategory::SourceConnection) == 1);
    CHECK(code(ErrorCategory::Timeout) == 1);
    CHECK(code(ErrorCategory::NotFound) == 2);
    CHECK(code(ErrorCategory::Syntax) == 3);
    CHECK(code(ErrorCategory::UnknownParameter) == 4);
    CHECK(code(ErrorCategory::UnknownStrategy) == 5);
    CHECK(code(ErrorCategory::Config) == 5);
    CHECK(code(ErrorCategory::Internal) == 99);
    CHECK(ExitCodeFor(ErrorCategory::JoinCondition) == 3);
    CHECK(ExitCodeFor(ErrorCategory::MappingSynthesis) == 99);
}

TEST_CASE("Error: category names are snake_case", "[result][error]") {
    CHECK(std::string(ErrorCategoryName(ErrorCategory::UnknownParameter)) == "unknown_parameter");
    CHECK(std::string(ErrorCategoryName(ErrorCategory::SourceConnection)) == "source_connection");
    CHECK(std::string(ErrorCategoryName(ErrorCategory::MappingSynthesis)) == "mapping_synthesis");
}

TEST_CASE("Error: ToJson carries category, message and exit code", "[result][error]") {
    auto e = Error::Make(ErrorCategory::UnknownParameter, "BindParameters", ":id",
                         "No value supplied for query parameter 'id'");
    auto json = e.ToJson();
    CHECK(json.find(R"("category":"unknown_parameter")") != std::string::npos);
    CHECK(json.find(R"("operation":"BindParameters")") != std::string::npos);
    CHECK(json.find(R"("target":":id")") != std::string::npos);
    CHECK(json.find(R"("message":"No value supplied for query parameter 'id'")") !=
          std::string::npos);
    CHECK(json.find(R"("exit_code":4)") != std::string::npos);
    CHECK(json.find("detail") == std::string::npos);
}

TEST_CASE("Error: ToJson is valid JSON for any message", "[result][error]") {
    auto e = Error::Make(ErrorCategory::Syntax, "ParseQuery", "", "near \"x\"\n", "line 1");
    auto j = nlohmann::json::parse(e.ToJson());
    CHECK(j["error"]["message"] == "near \"x\"\n");
    CHECK(j["error"]["detail"] == "line 1");
    CHECK_FALSE(j["error"].contains("target"));
    CHECK(j["error"]["exit_code"] == 3);
}

TEST_CASE("Error: Make drops an empty detail", "[result][error]") {
    auto e = Error::Make(ErrorCategory::Config, "Load", "", "bad", std::string{});
    CHECK_FALSE(e.detail.has_value());
    CHECK(e == Error::Make(ErrorCategory::Config, "Load", "", "bad"));
}

TEST_CASE("Error: equality compares every field", "[result][error]") {
    auto a = Error::Make(ErrorCategory::NotFound, "Find", "1", "missing");
    auto b = a;
    CHECK(a == b);
    b.category = ErrorCategory::Internal;
    CHECK(a != b);
}
