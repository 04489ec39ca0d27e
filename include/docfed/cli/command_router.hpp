#pragma once

#include <docfed/core/result.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docfed {

// Arguments after `docfed [global-flags]`: `<group> <action> [words] [--flags]`.
// A flag may repeat (`--param a=1 --param b=2`); all values are kept in order.
struct CommandArgs {
    std::string group;
    std::string action;
    std::vector<std::string> positional;
    std::map<std::string, std::vector<std::string>> flags;

    [[nodiscard]] bool HasFlag(const std::string& key) const {
        return flags.count(key) > 0;
    }

    /// Last value given for the flag, or `fallback`.
    [[nodiscard]] std::string Flag(const std::string& key,
                                   const std::string& fallback = "") const;

    [[nodiscard]] std::vector<std::string> FlagValues(const std::string& key) const;
};

// Returns the process exit code.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // "sources"
    std::string placeholder; // "<ids>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;
    std::string args_description;
    std::string long_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter: `docfed <group> <action>` dispatch with generated help.
//
// Help is intercepted before the handler runs: a bare group, `group help`,
// `group --help` and `group action --help`/`-h`. Routing failures exit 5;
// with --json they are printed as {"error":{"category":"usage",...}}.
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  std::optional<CommandHelp> help = std::nullopt);

    void SetGroupDescription(const std::string& group, const std::string& description);
    void SetGroupExamples(const std::string& group, std::vector<std::string> examples);

    int Dispatch(int argc, const char* const* argv,
                 std::ostream& out = std::cout,
                 std::ostream& err = std::cerr) const;

    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // Flags that never consume the following token.
    static bool IsBooleanFlag(std::string_view flag);

    /// Groups with at least one registered action, sorted.
    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    /// Actions of a group, sorted by name.
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;
    [[nodiscard]] std::vector<std::string> GroupExamples(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group,
                          const std::string& action,
                          std::ostream& out) const;

private:
    struct Group {
        std::string description;
        std::vector<std::string> examples;
        std::map<std::string, CommandInfo> actions;
    };

    const CommandInfo* Find(const std::string& group, const std::string& action) const;

    std::map<std::string, Group> groups_;
};

} // namespace docfed
