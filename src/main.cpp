#include <docfed/cli/command_executor.hpp>
#include <docfed/cli/command_router.hpp>
#include <docfed/cli/output_formatter.hpp>
#include <docfed/config/config_loader.hpp>
#include <docfed/core/log.hpp>
#include <docfed/core/terminal.hpp>
#include <docfed/core/version.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

// Resolve color mode for help output (stdout-based, before logger init).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") force_color = true;
        if (arg == "--no-color") force_no_color = true;
    }
    return docfed::ResolveColorMode(force_color, force_no_color);
}

// --version and --help count only before the first positional (group)
// argument; after it they belong to the command.
bool HasLeadingFlag(int argc, const char* const* argv, std::string_view a,
                    std::string_view b = {}) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == a || (!b.empty() && arg == b)) return true;
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

// Reads the YAML file named by the CLI (or the default one when present)
// and merges the CLI overrides on top.
docfed::Result<docfed::AppConfig, docfed::Error> LoadConfig(const docfed::AppConfig& cli) {
    using namespace docfed;
    AppConfig base;
    std::error_code ec;
    if (cli.config_path_explicit || std::filesystem::exists(cli.config_path, ec)) {
        auto yaml = LoadFromYaml(cli.config_path);
        if (yaml.IsErr()) {
            return yaml;
        }
        base = std::move(yaml).Value();
    }
    AppConfig merged = MergeConfigs(base, cli);
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(merged));
}

docfed::Result<void, docfed::Error> InitLogging(const docfed::AppConfig& config) {
    using namespace docfed;
    auto level = ResolveLogLevel(config);
    if (level.IsErr()) {
        return Result<void, Error>::Err(std::move(level).Error());
    }

    const bool use_color =
        !config.force_no_color && !NoColorEnvSet() && (config.force_color || IsStderrTty());
    auto sinks = std::make_unique<FanOutSink>();
    sinks->Add(std::make_unique<TextSink>(use_color));
    if (config.log_file) {
        auto file = FileSink::Open(*config.log_file);
        if (file.IsErr()) {
            return Result<void, Error>::Err(std::move(file).Error());
        }
        sinks->Add(std::move(file).Value());
    }
    InitGlobalLogger(std::move(sinks), level.Value());
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace docfed;

    if (argc == 1) {
        CommandContext context{AppConfig{}};
        CommandRouter router;
        RegisterAllCommands(router, context);
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HasLeadingFlag(argc, argv, "--version")) {
        std::cout << "docfed " << kVersion << "\n";
        return kExitSuccess;
    }

    if (HasLeadingFlag(argc, argv, "--help", "-h")) {
        CommandContext context{AppConfig{}};
        CommandRouter router;
        RegisterAllCommands(router, context);
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    const OutputFormatter early_fmt(HasJsonFlag(argc, argv), false);

    auto split = SplitGlobalArgs(argc, argv);
    auto cli = LoadFromCli(static_cast<int>(split.global.size()), split.global.data());
    if (cli.IsErr()) {
        early_fmt.PrintError(cli.Error());
        return cli.Error().ExitCode();
    }

    auto config = LoadConfig(cli.Value());
    if (config.IsErr()) {
        early_fmt.PrintError(config.Error());
        return config.Error().ExitCode();
    }

    auto logging = InitLogging(config.Value());
    if (logging.IsErr()) {
        early_fmt.PrintError(logging.Error());
        return logging.Error().ExitCode();
    }
    LogDebug("cli", "Loaded " + std::to_string(config.Value().data_sources.size()) +
                        " data source(s) from " + config.Value().config_path);

    CommandContext context{std::move(config).Value()};
    CommandRouter router;
    RegisterAllCommands(router, context);
    return router.Dispatch(static_cast<int>(split.command.size()), split.command.data());
}
