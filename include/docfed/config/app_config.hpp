#pragma once

#include <docfed/engine/federation_engine.hpp>
#include <docfed/engine/source_registry.hpp>
#include <docfed/mapping/schema_mapping.hpp>

#include <optional>
#include <string>
#include <vector>

namespace docfed {

struct EngineConfig {
    int refresh_interval_minutes = 15;
    int connect_timeout_seconds = 10;
    std::optional<std::string> snapshot_dir;  // in-memory snapshots when unset
    bool annotate_source = false;
    int refresh_workers = 1;
};

struct AppConfig {
    EngineConfig engine;
    std::vector<DataSource> data_sources;
    std::vector<SchemaMapping> mappings;
    std::vector<SavedQuery> queries;

    std::string config_path = "docfed.yaml";
    bool config_path_explicit = false;  // -c/--config given on the command line
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool force_color = false;
    bool force_no_color = false;
    int verbosity = 0;  // -v = 1, -vv = 2
};

} // namespace docfed
