#include <docfed/config/config_loader.hpp>

#include <docfed/adapters/adapter_factory.hpp>
#include <docfed/core/types.hpp>
#include <docfed/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <set>
#include <stdexcept>

namespace docfed {

namespace {

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", target, message);
}

// Plain YAML scalars become null, booleans or numbers where they read as
// such; quoted scalars always stay strings.
Json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return Json(nullptr);
        case YAML::NodeType::Sequence: {
            Json arr = Json::array();
            for (const auto& item : node) arr.push_back(YamlToJson(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            Json obj = Json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Scalar:
            break;
    }
    const std::string text = node.Scalar();
    if (node.Tag() == "!") {
        return Json(text);
    }
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Json(nullptr);
    }
    if (text == "true" || text == "True" || text == "TRUE") return Json(true);
    if (text == "false" || text == "False" || text == "FALSE") return Json(false);
    if (auto number = ParseNumber(text)) {
        return ValueToJson(Value(*number));
    }
    return Json(text);
}

std::string ResolvePath(const std::string& path, std::string_view base_dir) {
    std::filesystem::path p(path);
    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }
    return (std::filesystem::path(std::string(base_dir)) / p).lexically_normal().string();
}

Result<CollectionRef, Error> ParseCollectionRef(const YAML::Node& node, const std::string& what,
                                                const std::string& mapping_name) {
    if (!node || !node.IsMap() || !node["id"] || !node["collection"]) {
        return Result<CollectionRef, Error>::Err(MakeConfigError(
            "Mapping '" + mapping_name + "' " + what + " needs 'id' and 'collection'",
            mapping_name));
    }
    return Result<CollectionRef, Error>::Ok(
        CollectionRef{node["id"].as<SourceId>(), node["collection"].as<std::string>()});
}

Result<DataSource, Error> ParseYamlSource(const YAML::Node& node, std::string_view base_dir) {
    if (!node["id"]) {
        return Result<DataSource, Error>::Err(MakeConfigError("Data source entry missing 'id' field"));
    }
    if (!node["type"]) {
        return Result<DataSource, Error>::Err(
            MakeConfigError("Data source entry missing 'type' field"));
    }

    DataSource source;
    source.id = node["id"].as<SourceId>();
    source.name = node["name"] ? node["name"].as<std::string>() : std::to_string(source.id);
    source.type = node["type"].as<std::string>();

    if (const auto& settings = node["config"]) {
        if (!settings.IsMap()) {
            return Result<DataSource, Error>::Err(
                MakeConfigError("'config' of data source '" + source.name + "' must be a map",
                                source.name));
        }
        for (const auto& kv : settings) {
            source.config.settings[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (auto path = source.config.Setting("path")) {
        source.config.settings["path"] = ResolvePath(*path, base_dir);
    }

    if (const auto& collections = node["collections"]) {
        if (!collections.IsMap()) {
            return Result<DataSource, Error>::Err(MakeConfigError(
                "'collections' of data source '" + source.name + "' must be a map", source.name));
        }
        for (const auto& kv : collections) {
            const std::string name = kv.first.as<std::string>();
            auto rows = RowsFromJson(YamlToJson(kv.second));
            if (rows.IsErr()) {
                return Result<DataSource, Error>::Err(MakeConfigError(
                    "Collection '" + name + "' of data source '" + source.name +
                        "' must be a list of maps",
                    source.name));
            }
            source.config.collections[name] = std::move(rows).Value();
        }
    }
    return Result<DataSource, Error>::Ok(std::move(source));
}

Result<SchemaMapping, Error> ParseYamlMapping(const YAML::Node& node) {
    using R = Result<SchemaMapping, Error>;
    if (!node["id"]) {
        return R::Err(MakeConfigError("Mapping entry missing 'id' field"));
    }

    SchemaMapping mapping;
    mapping.id = node["id"].as<MappingId>();
    mapping.name = node["name"] ? node["name"].as<std::string>() : std::to_string(mapping.id);

    auto source = ParseCollectionRef(node["source"], "source", mapping.name);
    if (source.IsErr()) return R::Err(std::move(source).Error());
    mapping.source = std::move(source).Value();

    auto target = ParseCollectionRef(node["target"], "target", mapping.name);
    if (target.IsErr()) return R::Err(std::move(target).Error());
    mapping.target = std::move(target).Value();

    if (node["status"]) {
        auto status = ParseMappingStatus(node["status"].as<std::string>());
        if (status.IsErr()) return R::Err(std::move(status).Error());
        mapping.status = status.Value();
    }

    if (const auto& rules = node["rules"]) {
        for (const auto& rule_node : rules) {
            if (!rule_node["source_field"] || !rule_node["target_field"]) {
                return R::Err(MakeConfigError(
                    "Rule of mapping '" + mapping.name +
                        "' needs 'source_field' and 'target_field'",
                    mapping.name));
            }
            MappingRule rule;
            rule.source_field = rule_node["source_field"].as<std::string>();
            rule.target_field = rule_node["target_field"].as<std::string>();
            if (rule_node["kind"]) {
                auto kind = ParseRuleKind(rule_node["kind"].as<std::string>());
                if (kind.IsErr()) return R::Err(std::move(kind).Error());
                rule.kind = kind.Value();
            }
            if (rule_node["transform"]) {
                rule.transform = rule_node["transform"].as<std::string>();
            }
            if (rule.kind != RuleKind::Direct && rule.transform.empty()) {
                return R::Err(MakeConfigError(
                    "Rule " + rule.source_field + " -> " + rule.target_field + " of mapping '" +
                        mapping.name + "' is '" + RuleKindName(rule.kind) +
                        "' but names no transform",
                    mapping.name));
            }
            mapping.rules.push_back(std::move(rule));
        }
    }
    return R::Ok(std::move(mapping));
}

Result<SavedQuery, Error> ParseYamlQuery(const YAML::Node& node) {
    using R = Result<SavedQuery, Error>;
    if (!node["id"]) {
        return R::Err(MakeConfigError("Query entry missing 'id' field"));
    }
    if (!node["sql"]) {
        return R::Err(MakeConfigError("Query entry missing 'sql' field"));
    }

    SavedQuery query;
    query.id = node["id"].as<QueryId>();
    query.name = node["name"] ? node["name"].as<std::string>() : std::to_string(query.id);
    query.text = node["sql"].as<std::string>();
    if (const auto& sources = node["sources"]) {
        for (const auto& id : sources) query.source_ids.push_back(id.as<SourceId>());
    }
    if (node["strategy"]) {
        auto strategy = ParseFederationStrategy(node["strategy"].as<std::string>());
        if (strategy.IsErr()) return R::Err(std::move(strategy).Error());
        query.strategy = strategy.Value();
    }
    return R::Ok(std::move(query));
}

Result<AppConfig, Error> ParseRoot(const YAML::Node& root, std::string_view base_dir) {
    AppConfig config;

    // -- Engine --
    if (const auto& engine = root["engine"]) {
        if (engine["refresh_interval_minutes"]) {
            config.engine.refresh_interval_minutes = engine["refresh_interval_minutes"].as<int>();
        }
        if (engine["connect_timeout_seconds"]) {
            config.engine.connect_timeout_seconds = engine["connect_timeout_seconds"].as<int>();
        }
        if (engine["snapshot_dir"]) {
            config.engine.snapshot_dir =
                ResolvePath(engine["snapshot_dir"].as<std::string>(), base_dir);
        }
        if (engine["annotate_source"]) {
            config.engine.annotate_source = engine["annotate_source"].as<bool>();
        }
        if (engine["refresh_workers"]) {
            config.engine.refresh_workers = engine["refresh_workers"].as<int>();
        }
    }

    // -- Data sources --
    if (const auto& sources = root["data_sources"]) {
        for (const auto& node : sources) {
            auto source = ParseYamlSource(node, base_dir);
            if (source.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(source).Error());
            }
            config.data_sources.push_back(std::move(source).Value());
        }
    }

    // -- Mappings --
    if (const auto& mappings = root["mappings"]) {
        for (const auto& node : mappings) {
            auto mapping = ParseYamlMapping(node);
            if (mapping.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(mapping).Error());
            }
            config.mappings.push_back(std::move(mapping).Value());
        }
    }

    // -- Saved queries --
    if (const auto& queries = root["queries"]) {
        for (const auto& node : queries) {
            auto query = ParseYamlQuery(node);
            if (query.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(query).Error());
            }
            config.queries.push_back(std::move(query).Value());
        }
    }

    // -- Options --
    if (root["log_level"]) {
        config.log_level = root["log_level"].as<std::string>();
    }
    if (root["log_file"]) {
        config.log_file = ResolvePath(root["log_file"].as<std::string>(), base_dir);
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    try {
        YAML::Node root = YAML::LoadFile(path);
        const std::string base_dir = std::filesystem::path(path).parent_path().string();
        auto config = ParseRoot(root, base_dir);
        if (config.IsOk()) {
            AppConfig value = std::move(config).Value();
            value.config_path = path;
            return Result<AppConfig, Error>::Ok(std::move(value));
        }
        return config;
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(Error::Make(
            ErrorCategory::Config, "ConfigLoader", path, "Failed to parse YAML file", e.what()));
    }
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml, std::string_view base_dir) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml)), base_dir);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(Error::Make(
            ErrorCategory::Config, "ConfigLoader", "", "Failed to parse YAML", e.what()));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("docfed", kVersion, argparse::default_arguments::none);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Info-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Also write JSON log lines to this file");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--refresh-interval")
        .help("Materialized refresh interval in minutes")
        .scan<'i', int>();
    program.add_argument("--connect-timeout")
        .help("Source connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--snapshot-dir")
        .help("Directory for collection snapshots");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto val = program.present("--config")) {
        config.config_path = *val;
        config.config_path_explicit = true;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--color")) {
        config.force_color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.force_no_color = true;
    }
    if (program.get<bool>("--verbose")) {
        config.verbosity = 1;
    }
    if (program.get<bool>("-vv")) {
        config.verbosity = 2;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        config.log_level = *val;
    }
    if (auto val = program.present<int>("--refresh-interval")) {
        config.engine.refresh_interval_minutes = *val;
    }
    if (auto val = program.present<int>("--connect-timeout")) {
        config.engine.connect_timeout_seconds = *val;
    }
    if (auto val = program.present("--snapshot-dir")) {
        config.engine.snapshot_dir = *val;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const EngineConfig defaults;

    if (cli_overrides.engine.refresh_interval_minutes != defaults.refresh_interval_minutes) {
        merged.engine.refresh_interval_minutes = cli_overrides.engine.refresh_interval_minutes;
    }
    if (cli_overrides.engine.connect_timeout_seconds != defaults.connect_timeout_seconds) {
        merged.engine.connect_timeout_seconds = cli_overrides.engine.connect_timeout_seconds;
    }
    if (cli_overrides.engine.snapshot_dir.has_value()) {
        merged.engine.snapshot_dir = cli_overrides.engine.snapshot_dir;
    }

    if (cli_overrides.config_path_explicit) {
        merged.config_path = cli_overrides.config_path;
        merged.config_path_explicit = true;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.force_color) {
        merged.force_color = true;
    }
    if (cli_overrides.force_no_color) {
        merged.force_no_color = true;
    }
    if (cli_overrides.verbosity > merged.verbosity) {
        merged.verbosity = cli_overrides.verbosity;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.engine.refresh_interval_minutes <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "refresh_interval_minutes must be positive, got " +
            std::to_string(config.engine.refresh_interval_minutes)));
    }
    if (config.engine.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "connect_timeout_seconds must be positive, got " +
            std::to_string(config.engine.connect_timeout_seconds)));
    }
    if (config.engine.refresh_workers <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "refresh_workers must be positive, got " +
            std::to_string(config.engine.refresh_workers)));
    }
    if (config.log_level) {
        auto level = ParseLogLevel(*config.log_level);
        if (level.IsErr()) return Result<void, Error>::Err(std::move(level).Error());
    }

    const auto factory = AdapterFactory::WithBuiltins();
    std::set<SourceId> source_ids;
    for (const auto& source : config.data_sources) {
        if (!source_ids.insert(source.id).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate data source id: " + std::to_string(source.id)));
        }
        if (!factory.Has(source.type)) {
            return Result<void, Error>::Err(MakeConfigError(
                "Data source '" + source.name + "' has unknown type '" + source.type + "'",
                source.name));
        }
    }

    std::set<MappingId> mapping_ids;
    for (const auto& mapping : config.mappings) {
        if (!mapping_ids.insert(mapping.id).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate mapping id: " + std::to_string(mapping.id)));
        }
        if (source_ids.count(mapping.source.source_id) == 0) {
            return Result<void, Error>::Err(MakeConfigError(
                "Mapping '" + mapping.name + "' reads from unknown data source " +
                    std::to_string(mapping.source.source_id),
                mapping.name));
        }
        for (const auto* name : {&mapping.source.collection, &mapping.target.collection}) {
            auto valid = CollectionName::Create(*name);
            if (valid.IsErr()) {
                return Result<void, Error>::Err(MakeConfigError(
                    "Mapping '" + mapping.name + "': " + valid.Error(), mapping.name));
            }
        }
    }

    std::set<QueryId> query_ids;
    for (const auto& query : config.queries) {
        if (!query_ids.insert(query.id).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate query id: " + std::to_string(query.id)));
        }
        if (query.source_ids.empty()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Query '" + query.name + "' selects no data sources", query.name));
        }
        for (SourceId id : query.source_ids) {
            if (source_ids.count(id) == 0) {
                return Result<void, Error>::Err(MakeConfigError(
                    "Query '" + query.name + "' uses unknown data source " + std::to_string(id),
                    query.name));
            }
        }
    }
    return Result<void, Error>::Ok();
}

Result<LogLevel, Error> ResolveLogLevel(const AppConfig& config) {
    if (config.verbosity >= 2) return Result<LogLevel, Error>::Ok(LogLevel::Debug);
    if (config.verbosity == 1) return Result<LogLevel, Error>::Ok(LogLevel::Info);
    if (config.log_level) return ParseLogLevel(*config.log_level);
    return Result<LogLevel, Error>::Ok(LogLevel::Warn);
}

EngineOptions ToEngineOptions(const EngineConfig& config) {
    EngineOptions options;
    options.refresh_interval = std::chrono::minutes(config.refresh_interval_minutes);
    options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    options.annotate_source = config.annotate_source;
    options.refresh_workers = static_cast<size_t>(config.refresh_workers);
    return options;
}

// ---------------------------------------------------------------------------
// BuildEngine
// ---------------------------------------------------------------------------
Result<std::unique_ptr<FederationEngine>, Error> BuildEngine(const AppConfig& config) {
    using R = Result<std::unique_ptr<FederationEngine>, Error>;

    std::unique_ptr<ISnapshotStore> snapshots;
    if (config.engine.snapshot_dir) {
        auto store = FileSnapshotStore::Open(*config.engine.snapshot_dir);
        if (store.IsErr()) return R::Err(std::move(store).Error());
        snapshots = std::move(store).Value();
    }

    auto engine = std::make_unique<FederationEngine>(ToEngineOptions(config.engine),
                                                     std::move(snapshots));
    for (const auto& source : config.data_sources) {
        auto added = engine->AddDataSource(source);
        if (added.IsErr()) return R::Err(std::move(added).Error());
    }
    for (const auto& mapping : config.mappings) {
        auto added = engine->AddMapping(mapping);
        if (added.IsErr()) return R::Err(std::move(added).Error());
    }
    for (const auto& query : config.queries) {
        auto added = engine->AddSavedQuery(query);
        if (added.IsErr()) return R::Err(std::move(added).Error());
    }
    return R::Ok(std::move(engine));
}

} // namespace docfed
