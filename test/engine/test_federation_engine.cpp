#include <catch2/catch_test_macros.hpp>

#include "mocks/manual_clock.hpp"
#include "mocks/mock_source_adapter.hpp"

#include <docfed/engine/federation_engine.hpp>

using namespace docfed;
using namespace docfed::testing;

namespace {

DataSource InlineSource(SourceId id, const std::string& collection, Rows rows) {
    DataSource source;
    source.id = id;
    source.name = collection + "-store";
    source.type = "inline";
    source.config.collections[collection] = std::move(rows);
    return source;
}

// Users on source 1, orders on source 2.
void AddUsersAndOrders(FederationEngine& engine) {
    REQUIRE(engine.AddDataSource(InlineSource(
                        1, "users", {Row{{"uid", Value("1")}, {"name", Value("Ann")}}}))
                .IsOk());
    REQUIRE(engine.AddDataSource(InlineSource(
                        2, "orders",
                        {Row{{"orderId", Value("o1")}, {"userId", Value("1")},
                             {"amount", Value(9.5)}}}))
                .IsOk());
}

FederatedQuery Query(const std::string& text, std::vector<SourceId> ids,
                     FederationStrategy strategy = FederationStrategy::Virtual) {
    FederatedQuery query;
    query.text = text;
    query.source_ids = std::move(ids);
    query.strategy = strategy;
    return query;
}

} // anonymous namespace

// ===========================================================================
// Queries
// ===========================================================================

TEST_CASE("FederationEngine: join across two sources", "[engine]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);

    auto result = engine.ExecuteFederatedQuery(
        Query("SELECT users.name, orders.amount FROM users JOIN orders "
              "ON users.uid = orders.userId",
              {1, 2}));
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().rows.size() == 1);
    CHECK(result.Value().rows[0] == Row{{"name", Value("Ann")}, {"amount", Value(9.5)}});
    CHECK_FALSE(result.Value().cache_hit);
    CHECK(result.Value().warnings.empty());
}

TEST_CASE("FederationEngine: only selected sources contribute", "[engine]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);

    auto result = engine.ExecuteFederatedQuery(
        Query("SELECT * FROM users JOIN orders ON users.uid = orders.userId", {1}));
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().rows.size() == 1);
    CHECK_FALSE(result.Value().rows[0].Contains("orders.amount"));
}

TEST_CASE("FederationEngine: errors raised before any source is contacted", "[engine][errors]") {
    auto state = std::make_shared<MockSourceState>();
    auto factory = AdapterFactory::WithBuiltins();
    factory.Register("mock", MockSourceAdapter::Creator(state));
    FederationEngine engine({}, nullptr, factory);

    DataSource source;
    source.id = 1;
    source.type = "mock";
    REQUIRE(engine.AddDataSource(source).IsOk());

    SECTION("syntax") {
        auto r = engine.ExecuteFederatedQuery(Query("SELECT FROM", {1}));
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Syntax);
    }
    SECTION("missing parameter") {
        auto r = engine.ExecuteFederatedQuery(Query("SELECT * FROM users WHERE uid = :id", {1}));
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::UnknownParameter);
    }
    SECTION("unknown source") {
        auto r = engine.ExecuteFederatedQuery(Query("SELECT * FROM users", {1, 7}));
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::NotFound);
    }
    SECTION("no sources") {
        auto r = engine.ExecuteFederatedQuery(Query("SELECT * FROM users", {}));
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Config);
    }
    CHECK(state->ConnectCount() == 0);
}

TEST_CASE("FederationEngine: parameters bind", "[engine]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);
    auto query = Query("SELECT name FROM users WHERE uid = :id", {1});
    query.params["id"] = Value("1");

    auto result = engine.ExecuteFederatedQuery(query);
    REQUIRE(result.IsOk());
    CHECK(result.Value().rows == Rows{Row{{"name", Value("Ann")}}});
}

TEST_CASE("FederationEngine: unreachable sources surface SourceConnection", "[engine][errors]") {
    auto state = std::make_shared<MockSourceState>();
    state->SetFailConnect(true);
    auto factory = AdapterFactory::WithBuiltins();
    factory.Register("mock", MockSourceAdapter::Creator(state));
    FederationEngine engine({}, nullptr, factory);

    DataSource source;
    source.id = 1;
    source.type = "mock";
    REQUIRE(engine.AddDataSource(source).IsOk());

    auto r = engine.ExecuteFederatedQuery(Query("SELECT * FROM users", {1}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::SourceConnection);
    CHECK(engine.ListDataSources()[0].status == SourceStatus::Error);
}

TEST_CASE("FederationEngine: materialized results are cached per query", "[engine][strategy]") {
    auto clock = std::make_shared<ManualClock>();
    FederationEngine engine({}, nullptr, AdapterFactory::WithBuiltins(), clock);
    AddUsersAndOrders(engine);

    auto query = Query("SELECT * FROM users", {1}, FederationStrategy::Materialized);
    auto first = engine.ExecuteFederatedQuery(query);
    REQUIRE(first.IsOk());
    CHECK_FALSE(first.Value().cache_hit);
    REQUIRE(first.Value().next_update);

    auto second = engine.ExecuteFederatedQuery(query);
    REQUIRE(second.IsOk());
    CHECK(second.Value().cache_hit);

    clock->Advance(std::chrono::minutes(15));
    auto third = engine.ExecuteFederatedQuery(query);
    REQUIRE(third.IsOk());
    CHECK_FALSE(third.Value().cache_hit);
}

TEST_CASE("FederationEngine: configuration changes drop cached results", "[engine][strategy]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);
    auto query = Query("SELECT * FROM users", {1}, FederationStrategy::Materialized);
    REQUIRE(engine.ExecuteFederatedQuery(query).IsOk());

    REQUIRE(engine.UpdateDataSource(InlineSource(
                        1, "users", {Row{{"uid", Value("2")}, {"name", Value("Bob")}}}))
                .IsOk());
    auto after = engine.ExecuteFederatedQuery(query);
    REQUIRE(after.IsOk());
    CHECK_FALSE(after.Value().cache_hit);
    CHECK(*after.Value().rows[0].Find("name") == Value("Bob"));
}

TEST_CASE("FederationEngine: hybrid serves cache and refreshes", "[engine][strategy]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);
    auto query = Query("SELECT * FROM users", {1}, FederationStrategy::Hybrid);

    auto first = engine.ExecuteFederatedQuery(query);
    REQUIRE(first.IsOk());
    CHECK_FALSE(first.Value().cache_hit);

    auto second = engine.ExecuteFederatedQuery(query);
    REQUIRE(second.IsOk());
    CHECK(second.Value().cache_hit);
    CHECK_FALSE(second.Value().next_update);
    engine.WaitForRefreshes();
}

TEST_CASE("FederationEngine: mapping synthesizes a logical collection", "[engine][mapping]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);

    SchemaMapping mapping;
    mapping.id = 1;
    mapping.name = "users-to-customers";
    mapping.source = {1, "users"};
    mapping.target = {1, "customers"};
    mapping.rules = {{"uid", "customerId", RuleKind::Direct, ""},
                     {"name", "label", RuleKind::Transform, "toUpperCase"}};
    REQUIRE(engine.AddMapping(mapping).IsOk());

    auto result = engine.ExecuteFederatedQuery(Query("SELECT label FROM customers", {1}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().rows == Rows{Row{{"label", Value("ANN")}}});

    auto schema = engine.GetLogicalCollectionSchema(1, "customers");
    REQUIRE(schema.IsOk());
    REQUIRE(schema.Value());
    CHECK((*schema.Value() ==
           std::vector<FieldInfo>{{"customerId", "string"}, {"label", "string"}}));
}

TEST_CASE("FederationEngine: custom transform", "[engine][mapping]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);
    engine.RegisterTransform("shout", [](const Value& v) {
        return v.IsString() ? Value(v.AsString() + "!") : v;
    });

    SchemaMapping mapping;
    mapping.id = 1;
    mapping.source = {1, "users"};
    mapping.target = {1, "greetings"};
    mapping.rules = {{"name", "text", RuleKind::Custom, "shout"}};
    REQUIRE(engine.AddMapping(mapping).IsOk());

    auto result = engine.ExecuteFederatedQuery(Query("SELECT text FROM greetings", {1}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().rows == Rows{Row{{"text", Value("Ann!")}}});
}

// ===========================================================================
// Schema and collections
// ===========================================================================

TEST_CASE("FederationEngine: schema from the live adapter", "[engine][schema]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);

    auto schema = engine.GetLogicalCollectionSchema(2, "orders");
    REQUIRE(schema.IsOk());
    REQUIRE(schema.Value());
    CHECK(schema.Value()->size() == 3);

    auto missing = engine.GetLogicalCollectionSchema(2, "refunds");
    REQUIRE(missing.IsOk());
    CHECK_FALSE(missing.Value());

    CHECK(engine.GetLogicalCollectionSchema(9, "orders").Error().category ==
          ErrorCategory::NotFound);
}

TEST_CASE("FederationEngine: ListCollections", "[engine]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);
    auto names = engine.ListCollections(2);
    REQUIRE(names.IsOk());
    CHECK(names.Value() == std::vector<std::string>{"orders"});
    CHECK(engine.ListCollections(5).IsErr());
}

// ===========================================================================
// Configuration
// ===========================================================================

TEST_CASE("FederationEngine: RemoveDataSource drops its mappings", "[engine][config]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);
    SchemaMapping mapping;
    mapping.id = 4;
    mapping.source = {1, "users"};
    mapping.target = {1, "customers"};
    REQUIRE(engine.AddMapping(mapping).IsOk());

    REQUIRE(engine.RemoveDataSource(1).IsOk());
    CHECK(engine.ListMappings().empty());
    CHECK(engine.ListDataSources().size() == 1);
    CHECK(engine.RemoveDataSource(1).Error().category == ErrorCategory::NotFound);
}

TEST_CASE("FederationEngine: saved queries", "[engine][saved]") {
    FederationEngine engine;
    AddUsersAndOrders(engine);

    SavedQuery saved;
    saved.id = 10;
    saved.name = "user by id";
    saved.text = "SELECT name FROM users WHERE uid = :id";
    saved.source_ids = {1};
    saved.strategy = FederationStrategy::Materialized;
    REQUIRE(engine.AddSavedQuery(saved).IsOk());
    CHECK(engine.AddSavedQuery(saved).Error().category == ErrorCategory::Config);
    REQUIRE(engine.FindSavedQuery(10));
    CHECK(engine.ListSavedQueries().size() == 1);

    auto result = engine.ExecuteSavedQuery(10, {{"id", Value("1")}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().rows == Rows{Row{{"name", Value("Ann")}}});
    CHECK(result.Value().next_update.has_value());

    CHECK(engine.ExecuteSavedQuery(11, {}).Error().category == ErrorCategory::NotFound);

    REQUIRE(engine.RemoveSavedQuery(10).IsOk());
    CHECK_FALSE(engine.FindSavedQuery(10));
    CHECK(engine.RemoveSavedQuery(10).Error().category == ErrorCategory::NotFound);
}

TEST_CASE("FederationEngine: saved query must parse", "[engine][saved]") {
    FederationEngine engine;
    SavedQuery saved;
    saved.id = 1;
    saved.text = "SELECT * FROM a WHERE x = 1 OR y = 2";
    auto r = engine.AddSavedQuery(saved);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Syntax);
}

TEST_CASE("FederationEngine: ValidateQuerySyntax", "[engine]") {
    FederationEngine engine;
    CHECK(engine.ValidateQuerySyntax("SELECT * FROM users").valid);
    CHECK_FALSE(engine.ValidateQuerySyntax("SELECT * users").valid);
}

TEST_CASE("FederatedResultToJson: shape", "[engine][json]") {
    FederatedResult result;
    result.rows = {Row{{"a", Value(1)}}};
    result.execution_time_ms = 2.5;
    result.last_updated = Timestamp{0};
    result.warnings.push_back(
        Error::Make(ErrorCategory::JoinCondition, "JoinRows", "orders", "skipped"));

    auto json = FederatedResultToJson(result);
    CHECK(json["rows"].dump() == R"([{"a":1}])");
    CHECK(json["cache_hit"] == false);
    CHECK(json["last_updated"] == "1970-01-01T00:00:00.000Z");
    CHECK(json["next_update"].is_null());
    REQUIRE(json["warnings"].size() == 1);
    CHECK(json["warnings"][0]["category"] == "join_condition");
}
