#include <catch2/catch_test_macros.hpp>

#include "mocks/mock_source_adapter.hpp"

#include <docfed/engine/source_registry.hpp>

#include <chrono>
#include <thread>
#include <vector>

using namespace docfed;
using namespace docfed::testing;

namespace {

DataSource MockSource(SourceId id, const std::string& name = "mock") {
    DataSource source;
    source.id = id;
    source.name = name;
    source.type = "mock";
    return source;
}

struct RegistryFixture {
    RegistryFixture() : state(std::make_shared<MockSourceState>()) {
        state->SetCollection("users", {Row{{"uid", Value("1")}}});
        factory.Register("mock", MockSourceAdapter::Creator(state));
    }

    std::shared_ptr<MockSourceState> state;
    AdapterFactory factory;
};

} // anonymous namespace

TEST_CASE("SourceRegistry: add, find and list", "[registry]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1, "a")).IsOk());
    REQUIRE(registry.AddSource(MockSource(2, "b")).IsOk());

    auto found = registry.FindSource(2);
    REQUIRE(found);
    CHECK(found->name == "b");
    CHECK(found->status == SourceStatus::Disconnected);
    CHECK(registry.ListSources().size() == 2);
    CHECK_FALSE(registry.FindSource(3));
}

TEST_CASE("SourceRegistry: duplicate id and unknown type are Config errors", "[registry]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1)).IsOk());
    CHECK(registry.AddSource(MockSource(1)).Error().category == ErrorCategory::Config);

    auto other = MockSource(2);
    other.type = "mongodb";
    CHECK(registry.AddSource(other).Error().category == ErrorCategory::Config);
}

TEST_CASE("SourceRegistry: Connect caches the adapter and records collections", "[registry]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1)).IsOk());

    auto first = registry.Connect(1);
    REQUIRE(first.IsOk());
    auto second = registry.Connect(1);
    REQUIRE(second.IsOk());
    CHECK(first.Value() == second.Value());
    CHECK(f.state->ConnectCount() == 1);

    auto source = registry.FindSource(1);
    CHECK(source->status == SourceStatus::Connected);
    CHECK(source->known_collections == std::vector<std::string>{"users"});
}

TEST_CASE("SourceRegistry: failed connect marks the source as error", "[registry]") {
    RegistryFixture f;
    f.state->SetFailConnect(true);
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1)).IsOk());

    auto r = registry.Connect(1);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::SourceConnection);
    CHECK(registry.FindSource(1)->status == SourceStatus::Error);
}

TEST_CASE("SourceRegistry: slow connect times out", "[registry]") {
    RegistryFixture f;
    f.state->SetConnectDelay(std::chrono::milliseconds(300));
    SourceRegistry registry(f.factory, std::chrono::milliseconds(20));
    REQUIRE(registry.AddSource(MockSource(1)).IsOk());

    auto r = registry.Connect(1);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(r.Error().ExitCode() == 1);
}

TEST_CASE("SourceRegistry: a hanging connect does not block other sources", "[registry]") {
    RegistryFixture f;
    auto healthy = std::make_shared<MockSourceState>();
    healthy->SetCollection("orders", {Row{{"orderId", Value("o1")}}});
    f.factory.Register("healthy", MockSourceAdapter::Creator(healthy));
    f.state->SetConnectDelay(std::chrono::milliseconds(1500));

    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1, "slow")).IsOk());
    auto fast = MockSource(2, "fast");
    fast.type = "healthy";
    REQUIRE(registry.AddSource(fast).IsOk());

    std::thread slow_connect([&registry] { (void)registry.Connect(1); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const auto start = std::chrono::steady_clock::now();
    auto connected = registry.Connect(2);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    slow_connect.join();

    REQUIRE(connected.IsOk());
    CHECK(elapsed < std::chrono::milliseconds(500));
    CHECK(registry.FindSource(1)->status == SourceStatus::Error);
}

TEST_CASE("SourceRegistry: concurrent connects to one source connect once", "[registry]") {
    RegistryFixture f;
    f.state->SetConnectDelay(std::chrono::milliseconds(100));
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1)).IsOk());

    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&registry] { (void)registry.Connect(1); });
    }
    for (auto& caller : callers) caller.join();

    CHECK(f.state->ConnectCount() == 1);
    CHECK(registry.FindSource(1)->status == SourceStatus::Connected);
}

TEST_CASE("SourceRegistry: Connect on unknown id is NotFound", "[registry]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    CHECK(registry.Connect(9).Error().category == ErrorCategory::NotFound);
}

TEST_CASE("SourceRegistry: config change forces a reconnect", "[registry]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1)).IsOk());
    REQUIRE(registry.Connect(1).IsOk());

    SECTION("rename only keeps the connection") {
        REQUIRE(registry.UpdateSource(MockSource(1, "renamed")).IsOk());
        CHECK(registry.FindSource(1)->name == "renamed");
        CHECK(registry.FindSource(1)->status == SourceStatus::Connected);
        REQUIRE(registry.Connect(1).IsOk());
        CHECK(f.state->ConnectCount() == 1);
    }
    SECTION("settings change disconnects") {
        auto changed = MockSource(1);
        changed.config.settings["path"] = "/elsewhere";
        REQUIRE(registry.UpdateSource(changed).IsOk());
        CHECK(registry.FindSource(1)->status == SourceStatus::Disconnected);
        REQUIRE(registry.Connect(1).IsOk());
        CHECK(f.state->ConnectCount() == 2);
    }
}

TEST_CASE("SourceRegistry: update and remove unknown ids", "[registry]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    CHECK(registry.UpdateSource(MockSource(5)).Error().category == ErrorCategory::NotFound);
    CHECK(registry.RemoveSource(5).Error().category == ErrorCategory::NotFound);

    REQUIRE(registry.AddSource(MockSource(5)).IsOk());
    REQUIRE(registry.RemoveSource(5).IsOk());
    CHECK(registry.ListSources().empty());
}

TEST_CASE("SourceRegistry: mappings need a registered source and unique ids", "[registry][mapping]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));

    SchemaMapping mapping;
    mapping.id = 1;
    mapping.source = {1, "users"};
    mapping.target = {1, "customers"};
    CHECK(registry.AddMapping(mapping).Error().category == ErrorCategory::NotFound);

    REQUIRE(registry.AddSource(MockSource(1)).IsOk());
    REQUIRE(registry.AddMapping(mapping).IsOk());
    CHECK(registry.AddMapping(mapping).Error().category == ErrorCategory::Config);
    CHECK(registry.ListMappings().size() == 1);

    REQUIRE(registry.RemoveMapping(1).IsOk());
    CHECK(registry.ListMappings().empty());
    CHECK(registry.RemoveMapping(1).Error().category == ErrorCategory::NotFound);
}

TEST_CASE("SourceRegistry: DisconnectAll resets status", "[registry]") {
    RegistryFixture f;
    SourceRegistry registry(f.factory, std::chrono::milliseconds(1000));
    REQUIRE(registry.AddSource(MockSource(1)).IsOk());
    auto adapter = registry.Connect(1);
    REQUIRE(adapter.IsOk());

    registry.DisconnectAll();
    CHECK_FALSE(adapter.Value()->IsConnected());
    CHECK(registry.FindSource(1)->status == SourceStatus::Disconnected);
}
