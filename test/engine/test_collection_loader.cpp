#include <catch2/catch_test_macros.hpp>

#include "mocks/manual_clock.hpp"
#include "mocks/mock_source_adapter.hpp"

#include <docfed/engine/collection_loader.hpp>

using namespace docfed;
using namespace docfed::testing;

namespace {

struct LoaderFixture {
    LoaderFixture() : users(std::make_shared<MockSourceState>()),
                      orders(std::make_shared<MockSourceState>()) {
        users->SetCollection("users", {Row{{"uid", Value("1")}, {"name", Value("Ann")}}});
        orders->SetCollection("orders", {Row{{"orderId", Value("o1")}, {"userId", Value("1")}}});
        factory.Register("users", MockSourceAdapter::Creator(users));
        factory.Register("orders", MockSourceAdapter::Creator(orders));
        REQUIRE(registry.AddSource(Source(1, "users")).IsOk());
        REQUIRE(registry.AddSource(Source(2, "orders")).IsOk());
    }

    static DataSource Source(SourceId id, const std::string& type) {
        DataSource source;
        source.id = id;
        source.name = type;
        source.type = type;
        return source;
    }

    std::shared_ptr<MockSourceState> users;
    std::shared_ptr<MockSourceState> orders;
    AdapterFactory factory;
    SourceRegistry registry{factory, std::chrono::milliseconds(1000)};
    InMemorySnapshotStore snapshots;
    TransformRegistry transforms;
    ManualClock clock;
};

} // anonymous namespace

TEST_CASE("CollectionLoader: fetches referenced collections from every source", "[loader]") {
    LoaderFixture f;
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);

    auto loaded = loader.Load({1, 2}, {"users", "orders"});
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().collections.size() == 2);
    CHECK(loaded.Value().collections.at("users").size() == 1);
    CHECK(loaded.Value().warnings.empty());

    // Only collections a source has are fetched from it.
    CHECK(f.users->FetchedCollections() == std::vector<std::string>{"users"});
    CHECK(f.orders->FetchedCollections() == std::vector<std::string>{"orders"});
}

TEST_CASE("CollectionLoader: fetched collections are snapshotted", "[loader][snapshot]") {
    LoaderFixture f;
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);
    REQUIRE(loader.Load({1}, {"users"}).IsOk());

    auto latest = f.snapshots.GetLatest(1, "users").Value();
    REQUIRE(latest);
    CHECK(latest->fetched_at == f.clock.Now());
    CHECK(latest->rows.size() == 1);
}

TEST_CASE("CollectionLoader: unregistered source is NotFound", "[loader]") {
    LoaderFixture f;
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);
    auto loaded = loader.Load({1, 9}, {"users"});
    REQUIRE(loaded.IsErr());
    CHECK(loaded.Error().category == ErrorCategory::NotFound);
    CHECK(f.users->ConnectCount() == 0);
}

TEST_CASE("CollectionLoader: failing source degrades to its snapshot", "[loader][degrade]") {
    LoaderFixture f;
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);
    REQUIRE(loader.Load({1}, {"users"}).IsOk());

    // New adapter instances refuse to connect.
    f.users->SetFailConnect(true);
    auto changed = LoaderFixture::Source(1, "users");
    changed.config.settings["k"] = "v";
    REQUIRE(f.registry.UpdateSource(changed).IsOk());

    auto loaded = loader.Load({1}, {"users"});
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().collections.at("users").size() == 1);
    REQUIRE(loaded.Value().warnings.size() == 1);
    CHECK(loaded.Value().warnings[0].category == ErrorCategory::SourceConnection);
}

TEST_CASE("CollectionLoader: one failing source among several", "[loader][degrade]") {
    LoaderFixture f;
    f.orders->SetFailConnect(true);
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);

    auto loaded = loader.Load({1, 2}, {"users", "orders"});
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().collections.count("users") == 1);
    CHECK(loaded.Value().collections.count("orders") == 0);
    CHECK(loaded.Value().warnings.size() == 1);
}

TEST_CASE("CollectionLoader: every source failing without snapshots", "[loader][degrade]") {
    LoaderFixture f;
    f.users->SetFailConnect(true);
    f.orders->SetFailConnect(true);
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);

    auto loaded = loader.Load({1, 2}, {"users", "orders"});
    REQUIRE(loaded.IsErr());
    CHECK(loaded.Error().category == ErrorCategory::SourceConnection);
    CHECK(loaded.Error().message == "No selected data source could be reached");
}

TEST_CASE("CollectionLoader: fetch failure falls back to the snapshot", "[loader][degrade]") {
    LoaderFixture f;
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);
    REQUIRE(loader.Load({1}, {"users"}).IsOk());

    f.users->SetFailFetch(true);
    auto loaded = loader.Load({1}, {"users"});
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().collections.at("users").size() == 1);
    CHECK(loaded.Value().warnings.size() == 1);
}

TEST_CASE("CollectionLoader: same collection on several sources is concatenated", "[loader]") {
    LoaderFixture f;
    f.orders->SetCollection("users", {Row{{"uid", Value("2")}, {"name", Value("Bob")}}});
    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock, true);

    auto loaded = loader.Load({1, 2}, {"users"});
    REQUIRE(loaded.IsOk());
    const auto& rows = loaded.Value().collections.at("users");
    REQUIRE(rows.size() == 2);
    CHECK(*rows[0].Find("__source") == Value(1));
    CHECK(*rows[1].Find("__source") == Value(2));
    CHECK(*rows[1].Find("name") == Value("Bob"));
}

TEST_CASE("CollectionLoader: mapping synthesizes a missing collection", "[loader][mapping]") {
    LoaderFixture f;
    SchemaMapping mapping;
    mapping.id = 1;
    mapping.name = "users-to-customers";
    mapping.source = {1, "users"};
    mapping.target = {1, "customers"};
    mapping.rules = {{"name", "customer_name", RuleKind::Transform, "uppercase"}};
    REQUIRE(f.registry.AddMapping(mapping).IsOk());

    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);
    auto loaded = loader.Load({1}, {"customers"});
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Value().collections.count("customers") == 1);
    CHECK(loaded.Value().collections.at("customers")[0] ==
          Row{{"customer_name", Value("ANN")}});
}

TEST_CASE("CollectionLoader: mappings of unselected sources are ignored", "[loader][mapping]") {
    LoaderFixture f;
    SchemaMapping mapping;
    mapping.id = 1;
    mapping.source = {1, "users"};
    mapping.target = {1, "customers"};
    REQUIRE(f.registry.AddMapping(mapping).IsOk());

    CollectionLoader loader(f.registry, f.snapshots, f.transforms, f.clock);
    auto loaded = loader.Load({2}, {"customers"});
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().collections.count("customers") == 0);
    CHECK(f.users->ConnectCount() == 0);
}
