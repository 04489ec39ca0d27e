#include <docfed/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace docfed {

namespace {

bool StartsWithDashes(std::string_view token) {
    return token.size() >= 2 && token.substr(0, 2) == "--";
}

bool WantsJson(int argc, const char* const* argv) {
    return std::any_of(argv + 1, argv + argc,
                       [](const char* arg) { return std::string_view{arg} == "--json"; });
}

// Reports a routing failure with the configuration exit code. In text mode
// `then` prints help after the message; JSON mode prints only the error object.
template <typename HelpPrinter>
int UsageFailure(bool json, const std::string& message, std::ostream& err,
                 HelpPrinter&& then) {
    if (json) {
        nlohmann::json body;
        body["error"]["category"] = "usage";
        body["error"]["message"] = message;
        body["error"]["exit_code"] = ExitCodeFor(ErrorCategory::Config);
        err << body.dump() << "\n";
        return ExitCodeFor(ErrorCategory::Config);
    }
    std::string lowered = message;
    if (!lowered.empty()) {
        lowered[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(lowered[0])));
    }
    err << "Error: " << lowered << "\n";
    then();
    return ExitCodeFor(ErrorCategory::Config);
}

// Two-column listing: first column padded to the widest entry plus `gap`.
void PrintColumns(const std::vector<std::pair<std::string, std::string>>& rows,
                  size_t gap, std::ostream& out) {
    size_t width = 0;
    for (const auto& row : rows) width = std::max(width, row.first.size());
    for (const auto& [left, right] : rows) {
        out << "  " << left << std::string(width - left.size() + gap, ' ') << right << "\n";
    }
}

void PrintExamples(const std::vector<std::string>& examples, std::ostream& out) {
    if (examples.empty()) return;
    out << "\nExamples:\n";
    for (const auto& example : examples) out << "  " << example << "\n";
}

// Walks argv after the group/action words.
class ArgCursor {
public:
    ArgCursor(int argc, const char* const* argv, int start)
        : argc_(argc), argv_(argv), pos_(start) {}

    bool Done() const { return pos_ >= argc_; }
    std::string_view Peek() const { return std::string_view{argv_[pos_]}; }
    std::string_view Take() { return std::string_view{argv_[pos_++]}; }

private:
    int argc_;
    const char* const* argv_;
    int pos_;
};

} // anonymous namespace

// ===========================================================================
// CommandArgs
// ===========================================================================

std::string CommandArgs::Flag(const std::string& key, const std::string& fallback) const {
    auto values = flags.find(key);
    if (values == flags.end() || values->second.empty()) return fallback;
    return values->second.back();
}

std::vector<std::string> CommandArgs::FlagValues(const std::string& key) const {
    auto values = flags.find(key);
    if (values == flags.end()) return {};
    return values->second;
}

// ===========================================================================
// Parsing
// ===========================================================================

bool CommandRouter::IsBooleanFlag(std::string_view flag) {
    static constexpr std::string_view kBooleanFlags[] = {"--json", "--color", "--no-color",
                                                         "--help"};
    return std::find(std::begin(kBooleanFlags), std::end(kBooleanFlags), flag) !=
           std::end(kBooleanFlags);
}

Result<CommandArgs, std::string> CommandRouter::Parse(int argc, const char* const* argv) {
    using R = Result<CommandArgs, std::string>;
    if (argc < 2) {
        return R::Err("Missing command group. Usage: docfed <group> <action> [args]");
    }

    CommandArgs args;
    args.group = argv[1];
    if (!args.group.empty() && args.group.front() == '-') {
        return R::Err("Unexpected flag '" + args.group + "' before the command group");
    }

    ArgCursor cursor(argc, argv, 2);
    if (!cursor.Done() && !StartsWithDashes(cursor.Peek())) {
        args.action = std::string(cursor.Take());
    }

    while (!cursor.Done()) {
        const std::string_view token = cursor.Take();
        if (token == "-h") {
            args.flags["help"].emplace_back("true");
            continue;
        }
        if (!StartsWithDashes(token) || token.size() == 2) {
            args.positional.emplace_back(token);
            continue;
        }

        const std::string_view body = token.substr(2);
        const auto eq = body.find('=');
        if (eq != std::string_view::npos) {
            args.flags[std::string(body.substr(0, eq))].emplace_back(body.substr(eq + 1));
        } else if (IsBooleanFlag(token)) {
            args.flags[std::string(body)].emplace_back("true");
        } else if (!cursor.Done() && !StartsWithDashes(cursor.Peek())) {
            args.flags[std::string(body)].emplace_back(cursor.Take());
        } else {
            return R::Err("Flag '" + std::string(token) + "' needs a value");
        }
    }
    return R::Ok(std::move(args));
}

// ===========================================================================
// Registration and dispatch
// ===========================================================================

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             std::optional<CommandHelp> help) {
    groups_[group].actions[action] =
        CommandInfo{group, action, description, std::move(handler), std::move(help)};
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    groups_[group].description = description;
}

void CommandRouter::SetGroupExamples(const std::string& group,
                                     std::vector<std::string> examples) {
    groups_[group].examples = std::move(examples);
}

const CommandInfo* CommandRouter::Find(const std::string& group,
                                       const std::string& action) const {
    auto g = groups_.find(group);
    if (g == groups_.end()) return nullptr;
    auto a = g->second.actions.find(action);
    return a == g->second.actions.end() ? nullptr : &a->second;
}

int CommandRouter::Dispatch(int argc, const char* const* argv,
                            std::ostream& out, std::ostream& err) const {
    const bool json = WantsJson(argc, argv);
    auto parsed = Parse(argc, argv);
    if (parsed.IsErr()) {
        return UsageFailure(json, parsed.Error(), err, [&] { PrintHelp(err); });
    }
    const CommandArgs args = std::move(parsed).Value();

    if (!HasGroup(args.group)) {
        return UsageFailure(json, "Unknown command group '" + args.group + "'", err,
                            [&] { PrintHelp(err); });
    }

    const bool help_word = args.action == "help" || args.action == "--help" ||
                           args.action == "-h";
    if (args.action.empty() && json && !args.HasFlag("help")) {
        return UsageFailure(json, "Missing action for group '" + args.group + "'", err, [] {});
    }
    if (args.action.empty() || help_word) {
        PrintGroupHelp(args.group, out);
        return 0;
    }

    const CommandInfo* command = Find(args.group, args.action);
    if (command == nullptr) {
        return UsageFailure(json, "Unknown command '" + args.group + " " + args.action + "'",
                            err, [&] { PrintGroupHelp(args.group, err); });
    }
    if (args.HasFlag("help")) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }
    return command->handler(args);
}

// ===========================================================================
// Introspection
// ===========================================================================

std::vector<std::string> CommandRouter::Groups() const {
    std::vector<std::string> names;
    for (const auto& [name, group] : groups_) {
        if (!group.actions.empty()) names.push_back(name);
    }
    return names;
}

bool CommandRouter::HasGroup(const std::string& group) const {
    auto g = groups_.find(group);
    return g != groups_.end() && !g->second.actions.empty();
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    std::vector<CommandInfo> commands;
    auto g = groups_.find(group);
    if (g == groups_.end()) return commands;
    for (const auto& entry : g->second.actions) commands.push_back(entry.second);
    return commands;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto g = groups_.find(group);
    return g == groups_.end() ? std::string{} : g->second.description;
}

std::vector<std::string> CommandRouter::GroupExamples(const std::string& group) const {
    auto g = groups_.find(group);
    return g == groups_.end() ? std::vector<std::string>{} : g->second.examples;
}

// ===========================================================================
// Help text
// ===========================================================================

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: docfed [global-flags] <group> <action> [args]\n\nAvailable commands:\n";
    for (const auto& name : Groups()) {
        out << "\n  " << name << ":\n";
        for (const auto& [action, command] : groups_.at(name).actions) {
            out << "    " << action;
            if (!command.description.empty()) out << " - " << command.description;
            out << "\n";
        }
    }
    out << "\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    const std::string description = GroupDescription(group);
    out << "docfed " << group << " - " << (description.empty() ? group : description) << "\n";

    std::vector<std::pair<std::string, std::string>> rows;
    for (const auto& command : CommandsForGroup(group)) {
        rows.emplace_back(command.action, command.description);
    }
    out << "\nActions:\n";
    PrintColumns(rows, 6, out);
    PrintExamples(GroupExamples(group), out);
    out << "\nRun \"docfed " << group << " <action> --help\" for the flags of an action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    const CommandInfo* command = Find(group, action);
    if (command == nullptr) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    out << "docfed " << group << " " << action << " - " << command->description << "\n";
    if (!command->help) return;
    const CommandHelp& help = *command->help;

    if (!help.usage.empty()) out << "\nUsage:\n  " << help.usage << "\n";
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }
    if (!help.flags.empty()) {
        std::vector<std::pair<std::string, std::string>> rows;
        for (const auto& flag : help.flags) {
            std::string left = "--" + flag.name;
            if (!flag.placeholder.empty()) left += " " + flag.placeholder;
            rows.emplace_back(std::move(left),
                              flag.required ? flag.description + " (required)"
                                            : flag.description);
        }
        out << "\nFlags:\n";
        PrintColumns(rows, 4, out);
    }
    if (!help.long_description.empty()) out << "\n" << help.long_description << "\n";
    PrintExamples(help.examples, out);
}

} // namespace docfed
