#include <docfed/cli/command_executor.hpp>
#include <docfed/config/config_loader.hpp>
#include <docfed/core/ansi.hpp>
#include <docfed/core/log.hpp>
#include <docfed/core/terminal.hpp>
#include <docfed/query/query_parser.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <set>
#include <string>

namespace docfed {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

const std::set<std::string> kGlobalValueFlags = {
    "-c", "--config", "--log-file", "--log-level",
    "--refresh-interval", "--connect-timeout", "--snapshot-dir"};

Error MakeUsageError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "Usage", "", message);
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

std::string JoinPositional(const std::vector<std::string>& positional) {
    std::string out;
    for (size_t i = 0; i < positional.size(); ++i) {
        if (i > 0) out += " ";
        out += positional[i];
    }
    return out;
}

template <typename Int>
Result<Int, Error> ParseId(std::string_view text, const std::string& what) {
    Int value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return Result<Int, Error>::Err(
            MakeUsageError("Invalid " + what + " '" + std::string(text) + "'"));
    }
    return Result<Int, Error>::Ok(value);
}

std::string JoinIds(const std::vector<SourceId>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(ids[i]);
    }
    return out;
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

std::string RefText(const CollectionRef& ref) {
    return std::to_string(ref.source_id) + "." + ref.collection;
}

// ---------------------------------------------------------------------------
// query
// ---------------------------------------------------------------------------

int HandleQueryRun(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing query text. Usage: docfed query run \"<sql>\" [--sources 1,2]"));
    }

    FederatedQuery query;
    query.text = JoinPositional(args.positional);

    if (args.HasFlag("strategy")) {
        auto strategy = ParseFederationStrategy(args.Flag("strategy"));
        if (strategy.IsErr()) return Fail(fmt, strategy.Error());
        query.strategy = strategy.Value();
    }

    auto params = ParseParams(args.FlagValues("param"));
    if (params.IsErr()) return Fail(fmt, params.Error());
    query.params = std::move(params).Value();

    auto engine = ctx.Engine();
    if (engine.IsErr()) return Fail(fmt, engine.Error());

    if (args.HasFlag("sources")) {
        auto ids = ParseSourceIds(args.Flag("sources"));
        if (ids.IsErr()) return Fail(fmt, ids.Error());
        query.source_ids = std::move(ids).Value();
    } else {
        for (const auto& source : engine.Value()->ListDataSources()) {
            query.source_ids.push_back(source.id);
        }
    }

    auto result = engine.Value()->ExecuteFederatedQuery(query);
    if (result.IsErr()) return Fail(fmt, result.Error());
    fmt.PrintResult(result.Value());
    return 0;
}

int HandleQuerySaved(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError("Missing query id. Usage: docfed query saved <id>"));
    }
    auto id = ParseId<QueryId>(args.positional[0], "query id");
    if (id.IsErr()) return Fail(fmt, id.Error());

    auto params = ParseParams(args.FlagValues("param"));
    if (params.IsErr()) return Fail(fmt, params.Error());

    auto engine = ctx.Engine();
    if (engine.IsErr()) return Fail(fmt, engine.Error());

    auto result = engine.Value()->ExecuteSavedQuery(id.Value(), params.Value());
    if (result.IsErr()) return Fail(fmt, result.Error());
    fmt.PrintResult(result.Value());
    return 0;
}

int HandleQueryValidate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing query text. Usage: docfed query validate \"<sql>\""));
    }

    auto parsed = ParseQuery(JoinPositional(args.positional));
    if (parsed.IsErr()) return Fail(fmt, parsed.Error());

    const std::string canonical = ToQueryText(parsed.Value());
    if (fmt.IsJsonMode()) {
        Json j;
        j["valid"] = true;
        j["query"] = canonical;
        fmt.PrintJson(j);
    } else {
        fmt.PrintSuccess("Valid: " + canonical);
    }
    return 0;
}

int HandleQueryList(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    auto engine = ctx.Engine();
    if (engine.IsErr()) return Fail(fmt, engine.Error());

    const auto queries = engine.Value()->ListSavedQueries();
    if (fmt.IsJsonMode()) {
        Json arr = Json::array();
        for (const auto& q : queries) {
            arr.push_back({{"id", q.id},
                           {"name", q.name},
                           {"sql", q.text},
                           {"sources", q.source_ids},
                           {"strategy", FederationStrategyName(q.strategy)}});
        }
        fmt.PrintJson(arr);
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& q : queries) {
        rows.push_back({std::to_string(q.id), q.name, FederationStrategyName(q.strategy),
                        JoinIds(q.source_ids), q.text});
    }
    fmt.PrintTable({"Id", "Name", "Strategy", "Sources", "SQL"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// source
// ---------------------------------------------------------------------------

int HandleSourceList(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    auto engine = ctx.Engine();
    if (engine.IsErr()) return Fail(fmt, engine.Error());

    const auto sources = engine.Value()->ListDataSources();
    if (fmt.IsJsonMode()) {
        Json arr = Json::array();
        for (const auto& s : sources) {
            arr.push_back({{"id", s.id},
                           {"name", s.name},
                           {"type", s.type},
                           {"status", SourceStatusName(s.status)},
                           {"collections", s.known_collections}});
        }
        fmt.PrintJson(arr);
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& s : sources) {
        rows.push_back({std::to_string(s.id), s.name, s.type, SourceStatusName(s.status),
                        JoinNames(s.known_collections)});
    }
    fmt.PrintTable({"Id", "Name", "Type", "Status", "Collections"}, rows);
    return 0;
}

int HandleSourceCollections(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing source id. Usage: docfed source collections <id>"));
    }
    auto id = ParseId<SourceId>(args.positional[0], "source id");
    if (id.IsErr()) return Fail(fmt, id.Error());

    auto engine = ctx.Engine();
    if (engine.IsErr()) return Fail(fmt, engine.Error());

    auto collections = engine.Value()->ListCollections(id.Value());
    if (collections.IsErr()) return Fail(fmt, collections.Error());

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(Json(collections.Value()));
        return 0;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& name : collections.Value()) {
        rows.push_back({name});
    }
    fmt.PrintTable({"Collection"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// schema
// ---------------------------------------------------------------------------

int HandleSchemaShow(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    if (args.positional.size() < 2) {
        return Fail(fmt, MakeUsageError(
            "Usage: docfed schema show <source-id> <collection>"));
    }
    auto id = ParseId<SourceId>(args.positional[0], "source id");
    if (id.IsErr()) return Fail(fmt, id.Error());
    const std::string& collection = args.positional[1];

    auto engine = ctx.Engine();
    if (engine.IsErr()) return Fail(fmt, engine.Error());

    auto schema = engine.Value()->GetLogicalCollectionSchema(id.Value(), collection);
    if (schema.IsErr()) return Fail(fmt, schema.Error());
    if (!schema.Value()) {
        return Fail(fmt, Error::Make(ErrorCategory::NotFound, "SchemaShow", collection,
                                     "Collection '" + collection + "' is not known to source " +
                                         std::to_string(id.Value())));
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(SchemaToJson(*schema.Value()));
        return 0;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& field : *schema.Value()) {
        rows.push_back({field.name, field.type});
    }
    fmt.PrintTable({"Field", "Type"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// mapping
// ---------------------------------------------------------------------------

int HandleMappingList(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = ctx.Formatter(args);
    auto engine = ctx.Engine();
    if (engine.IsErr()) return Fail(fmt, engine.Error());

    const auto mappings = engine.Value()->ListMappings();
    if (fmt.IsJsonMode()) {
        Json arr = Json::array();
        for (const auto& m : mappings) {
            Json rules = Json::array();
            for (const auto& r : m.rules) {
                Json rule = {{"source_field", r.source_field},
                             {"target_field", r.target_field},
                             {"kind", RuleKindName(r.kind)}};
                if (!r.transform.empty()) rule["transform"] = r.transform;
                rules.push_back(std::move(rule));
            }
            arr.push_back({{"id", m.id},
                           {"name", m.name},
                           {"source", RefText(m.source)},
                           {"target", RefText(m.target)},
                           {"status", MappingStatusName(m.status)},
                           {"rules", std::move(rules)}});
        }
        fmt.PrintJson(arr);
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& m : mappings) {
        rows.push_back({std::to_string(m.id), m.name, RefText(m.source), RefText(m.target),
                        MappingStatusName(m.status), std::to_string(m.rules.size())});
    }
    fmt.PrintTable({"Id", "Name", "Source", "Target", "Status", "Rules"}, rows);
    return 0;
}

// Wraps ostream + color flag for help output.
struct Ansi {
    std::ostream& out;
    bool color;

    Ansi& Bold(const std::string& s) {
        if (color) out << ansi::kBold;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Dim(const std::string& s) {
        if (color) out << ansi::kDim;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Normal(const std::string& s) {
        out << s;
        return *this;
    }

    Ansi& Nl() {
        out << "\n";
        return *this;
    }
};

} // anonymous namespace

// ===========================================================================
// CommandContext
// ===========================================================================

CommandContext::CommandContext(AppConfig config, std::ostream& out, std::ostream& err)
    : config_(std::move(config)), out_(out), err_(err) {}

CommandContext::CommandContext(AppConfig config, std::unique_ptr<FederationEngine> engine,
                               std::ostream& out, std::ostream& err)
    : config_(std::move(config)), engine_(std::move(engine)), out_(out), err_(err) {}

Result<FederationEngine*, Error> CommandContext::Engine() {
    if (!engine_) {
        auto built = BuildEngine(config_);
        if (built.IsErr()) {
            return Result<FederationEngine*, Error>::Err(std::move(built).Error());
        }
        engine_ = std::move(built).Value();
        LogDebug("cli", "Engine built from " + config_.config_path);
    }
    return Result<FederationEngine*, Error>::Ok(engine_.get());
}

OutputFormatter CommandContext::Formatter(const CommandArgs& args) const {
    const bool json = config_.json_output || args.HasFlag("json");
    const bool color = ResolveColorMode(config_.force_color || args.HasFlag("color"),
                                        config_.force_no_color || args.HasFlag("no-color"));
    return OutputFormatter(json, color, out_, err_);
}

// ===========================================================================
// Argument helpers
// ===========================================================================

Value ParseParamValue(std::string_view text) {
    if (text == "null") return Value(nullptr);
    if (text == "true") return Value(true);
    if (text == "false") return Value(false);
    if (text.size() >= 2 && (text.front() == '\'' || text.front() == '"') &&
        text.back() == text.front()) {
        return Value(std::string(text.substr(1, text.size() - 2)));
    }
    if (auto number = ParseNumber(text)) {
        return Value(*number);
    }
    return Value(std::string(text));
}

Result<QueryParams, Error> ParseParams(const std::vector<std::string>& entries) {
    QueryParams params;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result<QueryParams, Error>::Err(MakeUsageError(
                "Parameter '" + entry + "' must have the form name=value"));
        }
        std::string name = entry.substr(0, eq);
        if (name.front() == ':') name.erase(0, 1);
        params[name] = ParseParamValue(std::string_view(entry).substr(eq + 1));
    }
    return Result<QueryParams, Error>::Ok(std::move(params));
}

Result<std::vector<SourceId>, Error> ParseSourceIds(std::string_view text) {
    std::vector<SourceId> ids;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        auto token = text.substr(start, comma == std::string_view::npos
                                            ? std::string_view::npos
                                            : comma - start);
        auto id = ParseId<SourceId>(token, "source id");
        if (id.IsErr()) {
            return Result<std::vector<SourceId>, Error>::Err(std::move(id).Error());
        }
        if (std::find(ids.begin(), ids.end(), id.Value()) == ids.end()) {
            ids.push_back(id.Value());
        }
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return Result<std::vector<SourceId>, Error>::Ok(std::move(ids));
}

SplitArgs SplitGlobalArgs(int argc, const char* const* argv) {
    SplitArgs split;
    if (argc < 1) return split;
    split.global.push_back(argv[0]);
    split.command.push_back(argv[0]);

    int i = 1;
    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg.empty() || arg[0] != '-') break;
        split.global.push_back(argv[i++]);
        if (kGlobalValueFlags.count(std::string(arg)) > 0 && i < argc) {
            split.global.push_back(argv[i++]);
        }
    }
    for (; i < argc; ++i) {
        split.command.push_back(argv[i]);
    }
    return split;
}

// ===========================================================================
// RegisterAllCommands
// ===========================================================================

void RegisterAllCommands(CommandRouter& router, CommandContext& context) {
    router.SetGroupDescription("query", "Run, validate and list federated queries");
    router.SetGroupExamples("query", {
        "$ docfed query run \"SELECT name FROM users WHERE uid = :id\" --param id=1",
        "$ docfed query run \"SELECT * FROM orders\" --sources 2 --strategy materialized",
        "$ docfed --json query saved 7 --param min=10",
        "$ docfed query validate \"SELECT * FROM users LIMIT 5\"",
    });

    router.SetGroupDescription("source", "Inspect configured data sources");
    router.SetGroupExamples("source", {
        "$ docfed source list",
        "$ docfed --json source collections 1",
    });

    router.SetGroupDescription("schema", "Show logical collection schemas");
    router.SetGroupExamples("schema", {
        "$ docfed schema show 2 customers",
    });

    router.SetGroupDescription("mapping", "Inspect schema mappings");
    router.SetGroupExamples("mapping", {
        "$ docfed mapping list",
    });

    // -----------------------------------------------------------------------
    // query run
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "docfed query run \"<sql>\" [flags]";
        help.args_description = "<sql>    Query text (SELECT ... FROM ... [JOIN] [WHERE] [ORDER BY] [LIMIT])";
        help.long_description =
            "Without --sources the query runs against every configured data source.";
        help.flags = {
            {"sources", "<ids>", "Comma-separated data source ids", false},
            {"param", "<name=value>", "Bind a :name placeholder (repeatable)", false},
            {"strategy", "<s>", "virtual (default), materialized or hybrid", false},
        };
        help.examples = {
            "docfed query run \"SELECT name, amount FROM users JOIN orders ON users.uid = orders.uid\"",
            "docfed query run \"SELECT * FROM users WHERE uid = :id\" --param id=1",
        };
        router.Register("query", "run", "Run a federated query",
                        [&context](const CommandArgs& args) {
                            return HandleQueryRun(context, args);
                        },
                        std::move(help));
    }

    // -----------------------------------------------------------------------
    // query saved
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "docfed query saved <id> [--param name=value]...";
        help.args_description = "<id>    Saved query id from the configuration";
        help.flags = {
            {"param", "<name=value>", "Bind a :name placeholder (repeatable)", false},
        };
        help.examples = {"docfed query saved 7 --param min=10"};
        router.Register("query", "saved", "Run a saved query",
                        [&context](const CommandArgs& args) {
                            return HandleQuerySaved(context, args);
                        },
                        std::move(help));
    }

    // -----------------------------------------------------------------------
    // query validate
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "docfed query validate \"<sql>\"";
        help.args_description = "<sql>    Query text to check";
        help.long_description = "Prints the canonical form of a valid query. Contacts no source.";
        router.Register("query", "validate", "Check query syntax",
                        [&context](const CommandArgs& args) {
                            return HandleQueryValidate(context, args);
                        },
                        std::move(help));
    }

    router.Register("query", "list", "List saved queries",
                    [&context](const CommandArgs& args) {
                        return HandleQueryList(context, args);
                    });

    router.Register("source", "list", "List configured data sources",
                    [&context](const CommandArgs& args) {
                        return HandleSourceList(context, args);
                    });

    {
        CommandHelp help;
        help.usage = "docfed source collections <id>";
        help.args_description = "<id>    Data source id";
        router.Register("source", "collections", "List the collections a source exposes",
                        [&context](const CommandArgs& args) {
                            return HandleSourceCollections(context, args);
                        },
                        std::move(help));
    }

    {
        CommandHelp help;
        help.usage = "docfed schema show <source-id> <collection>";
        help.args_description = "<source-id> <collection>    Collection to describe";
        help.long_description =
            "Uses the latest snapshot when there is one, else a mapping that "
            "synthesizes the collection, else the live source.";
        router.Register("schema", "show", "Show the fields of a collection",
                        [&context](const CommandArgs& args) {
                            return HandleSchemaShow(context, args);
                        },
                        std::move(help));
    }

    router.Register("mapping", "list", "List schema mappings",
                    [&context](const CommandArgs& args) {
                        return HandleMappingList(context, args);
                    });
}

// ===========================================================================
// PrintTopLevelHelp
// ===========================================================================

void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color) {
    Ansi a{out, color};

    a.Bold("docfed").Normal(" - query federation across document data sources").Nl().Nl();
    a.Dim("  Joins, filters and sorts collections from several sources with one query.").Nl();
    a.Dim("  All commands accept --json for machine-readable output.").Nl();

    out << "\n";
    a.Bold("USAGE").Nl();
    out << "  docfed [global-flags] <group> <action> [args] [flags]\n";

    const std::vector<std::string> group_order = {"query", "source", "schema", "mapping"};
    size_t max_left = 0;
    for (const auto& group : group_order) {
        for (const auto& cmd : router.CommandsForGroup(group)) {
            max_left = std::max(max_left, group.size() + 1 + cmd.action.size());
        }
    }

    for (const auto& group : group_order) {
        if (!router.HasGroup(group)) continue;
        out << "\n";
        std::string label = group;
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        a.Bold(label).Nl();
        for (const auto& cmd : router.CommandsForGroup(group)) {
            std::string left = group + " " + cmd.action;
            out << "  " << left << std::string(max_left - left.size() + 4, ' ');
            a.Dim(cmd.description).Nl();
        }
    }

    out << "\n";
    a.Bold("GLOBAL FLAGS").Nl();
    const std::vector<std::pair<std::string, std::string>> flags = {
        {"-c, --config <file>", "YAML configuration (default: docfed.yaml)"},
        {"--json", "JSON output"},
        {"--color / --no-color", "Force or disable colors"},
        {"-v / -vv", "Info / debug logging"},
        {"--log-file <path>", "Also write JSON log lines to a file"},
        {"--log-level <lvl>", "debug, info, warn or error"},
        {"--refresh-interval <min>", "Materialized cache lifetime"},
        {"--connect-timeout <s>", "Source connect timeout"},
        {"--snapshot-dir <dir>", "Persist collection snapshots"},
        {"--version", "Print version"},
    };
    size_t max_flag = 0;
    for (const auto& [flag, desc] : flags) max_flag = std::max(max_flag, flag.size());
    for (const auto& [flag, desc] : flags) {
        out << "  " << flag << std::string(max_flag - flag.size() + 4, ' ');
        a.Dim(desc).Nl();
    }

    out << "\n";
    a.Bold("EXAMPLES").Nl();
    out << "  docfed source list\n";
    out << "  docfed query run \"SELECT * FROM orders ORDER BY amount DESC LIMIT 5\"\n";
    out << "  docfed --json query saved 7 --param min=10\n";
    out << "\nUse \"docfed <group> --help\" for the actions of a group.\n";
}

} // namespace docfed
