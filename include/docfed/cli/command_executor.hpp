#pragma once

#include <docfed/cli/command_router.hpp>
#include <docfed/cli/output_formatter.hpp>
#include <docfed/config/app_config.hpp>
#include <docfed/engine/federation_engine.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// CommandContext: what command handlers share: the merged configuration,
// the output streams and the engine.
//
// The engine is built from the configuration on first use, so help and
// `query validate` never touch a data source. Tests inject a ready engine.
// ---------------------------------------------------------------------------
class CommandContext {
public:
    explicit CommandContext(AppConfig config,
                            std::ostream& out = std::cout,
                            std::ostream& err = std::cerr);
    CommandContext(AppConfig config, std::unique_ptr<FederationEngine> engine,
                   std::ostream& out, std::ostream& err);

    CommandContext(const CommandContext&) = delete;
    CommandContext& operator=(const CommandContext&) = delete;

    [[nodiscard]] const AppConfig& Config() const noexcept { return config_; }

    /// The engine, building it from the configuration if needed.
    [[nodiscard]] Result<FederationEngine*, Error> Engine();

    /// Formatter honoring --json/--color from both the global flags and the
    /// command's own flags.
    [[nodiscard]] OutputFormatter Formatter(const CommandArgs& args) const;

private:
    AppConfig config_;
    std::unique_ptr<FederationEngine> engine_;
    std::ostream& out_;
    std::ostream& err_;
};

// Register the query, source, schema and mapping commands.
void RegisterAllCommands(CommandRouter& router, CommandContext& context);

// Print top-level help (groups, global flags, examples).
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color);

// ---------------------------------------------------------------------------
// Argument helpers, exposed for tests.
// ---------------------------------------------------------------------------

/// Read a `--param` value: null, true/false, a number, a quoted string, or
/// else the raw text as a string.
Value ParseParamValue(std::string_view text);

/// `k=v` entries to a parameter map. Later entries win.
Result<QueryParams, Error> ParseParams(const std::vector<std::string>& entries);

/// "1,2,3" to source ids.
Result<std::vector<SourceId>, Error> ParseSourceIds(std::string_view text);

// Global flags (before the command group) split from the command part.
// Both vectors keep argv[0] at index 0.
struct SplitArgs {
    std::vector<const char*> global;
    std::vector<const char*> command;
};

SplitArgs SplitGlobalArgs(int argc, const char* const* argv);

} // namespace docfed
