#include <catch2/catch_test_macros.hpp>

#include <docfed/adapters/json_dir_adapter.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace docfed;

namespace fs = std::filesystem;

namespace {

// Temporary directory removed on scope exit.
class TempDir {
public:
    TempDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() / ("docfed_json_dir_" + std::to_string(stamp));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& Path() const { return path_; }

    void Write(const std::string& name, const std::string& content) const {
        std::ofstream(path_ / name) << content;
    }

private:
    fs::path path_;
};

SourceConfig PathConfig(const fs::path& path) {
    SourceConfig config;
    config.settings["path"] = path.string();
    return config;
}

} // anonymous namespace

TEST_CASE("JsonDirAdapter: path setting is required", "[adapters][json-dir]") {
    JsonDirAdapter adapter;
    auto r = adapter.Connect(SourceConfig{});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
    CHECK_FALSE(adapter.IsConnected());
}

TEST_CASE("JsonDirAdapter: missing directory is a connection error", "[adapters][json-dir]") {
    JsonDirAdapter adapter;
    auto r = adapter.Connect(PathConfig("/nonexistent/docfed/dir"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::SourceConnection);
    CHECK(r.Error().ExitCode() == 1);
}

TEST_CASE("JsonDirAdapter: one collection per .json file", "[adapters][json-dir]") {
    TempDir dir;
    dir.Write("users.json", R"([{"uid": "1", "name": "Ann"}])");
    dir.Write("orders.json", R"([])");
    dir.Write("notes.txt", "ignored");

    JsonDirAdapter adapter;
    REQUIRE(adapter.Connect(PathConfig(dir.Path())).IsOk());
    auto names = adapter.ListCollections();
    REQUIRE(names.IsOk());
    CHECK(names.Value() == std::vector<std::string>{"orders", "users"});
}

TEST_CASE("JsonDirAdapter: ExecuteQuery reads and filters", "[adapters][json-dir]") {
    TempDir dir;
    dir.Write("orders.json",
              R"([{"orderId": "o1", "userId": "1", "amount": 9.5},
                  {"orderId": "o2", "userId": "2", "amount": 20}])");

    JsonDirAdapter adapter;
    REQUIRE(adapter.Connect(PathConfig(dir.Path())).IsOk());

    auto all = adapter.ExecuteQuery("orders", {});
    REQUIRE(all.IsOk());
    REQUIRE(all.Value().size() == 2);
    CHECK(*all.Value()[0].Find("amount") == Value(9.5));

    FilterSpec spec;
    spec.filters.push_back({"userId", CompareOp::Eq, Value("2")});
    auto filtered = adapter.ExecuteQuery("orders", spec);
    REQUIRE(filtered.IsOk());
    REQUIRE(filtered.Value().size() == 1);
    CHECK(*filtered.Value()[0].Find("orderId") == Value("o2"));
}

TEST_CASE("JsonDirAdapter: missing collection file is empty", "[adapters][json-dir]") {
    TempDir dir;
    JsonDirAdapter adapter;
    REQUIRE(adapter.Connect(PathConfig(dir.Path())).IsOk());

    auto rows = adapter.ExecuteQuery("users", {});
    REQUIRE(rows.IsOk());
    CHECK(rows.Value().empty());

    auto schema = adapter.GetCollectionSchema("users");
    REQUIRE(schema.IsOk());
    CHECK_FALSE(schema.Value().has_value());
}

TEST_CASE("JsonDirAdapter: malformed files are connection errors", "[adapters][json-dir]") {
    TempDir dir;
    dir.Write("broken.json", "[{");
    dir.Write("scalar.json", "[1, 2]");

    JsonDirAdapter adapter;
    REQUIRE(adapter.Connect(PathConfig(dir.Path())).IsOk());

    auto broken = adapter.ExecuteQuery("broken", {});
    REQUIRE(broken.IsErr());
    CHECK(broken.Error().category == ErrorCategory::SourceConnection);
    CHECK(broken.Error().message == "Malformed JSON");

    auto scalar = adapter.ExecuteQuery("scalar", {});
    REQUIRE(scalar.IsErr());
    CHECK(scalar.Error().category == ErrorCategory::SourceConnection);
}

TEST_CASE("JsonDirAdapter: schema is inferred from the file", "[adapters][json-dir]") {
    TempDir dir;
    dir.Write("users.json", R"([{"uid": "1"}, {"uid": "2", "active": true}])");

    JsonDirAdapter adapter;
    REQUIRE(adapter.Connect(PathConfig(dir.Path())).IsOk());
    auto schema = adapter.GetCollectionSchema("users");
    REQUIRE(schema.IsOk());
    REQUIRE(schema.Value().has_value());
    CHECK(*schema.Value() ==
          std::vector<FieldInfo>{{"uid", "string"}, {"active", "boolean"}});
}

TEST_CASE("JsonDirAdapter: Disconnect stops access", "[adapters][json-dir]") {
    TempDir dir;
    JsonDirAdapter adapter;
    REQUIRE(adapter.Connect(PathConfig(dir.Path())).IsOk());
    adapter.Disconnect();
    CHECK_FALSE(adapter.IsConnected());
    CHECK(adapter.ListCollections().IsErr());
}
