#pragma once

#include <docfed/config/app_config.hpp>
#include <docfed/core/log.hpp>
#include <docfed/core/result.hpp>
#include <docfed/engine/federation_engine.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace docfed {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text. Relative `path` settings and `snapshot_dir` resolve
// against `base_dir`.
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml,
                                            std::string_view base_dir = "");

// Parse the global CLI flags (-c, --json, --color, --no-color, -v, -vv,
// --log-file, --log-level, --refresh-interval, --connect-timeout,
// --snapshot-dir). Command tokens must be stripped beforehand.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Unique ids, known strategies, mappings reference registered sources,
// positive intervals and timeouts.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Effective log level: -vv > -v > log_level > warn.
Result<LogLevel, Error> ResolveLogLevel(const AppConfig& config);

EngineOptions ToEngineOptions(const EngineConfig& config);

// Create an engine and register every source, mapping and saved query.
Result<std::unique_ptr<FederationEngine>, Error> BuildEngine(const AppConfig& config);

} // namespace docfed
