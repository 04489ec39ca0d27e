#include <docfed/cli/output_formatter.hpp>
#include <docfed/core/ansi.hpp>

#include <algorithm>
#include <cstdio>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace docfed {

namespace {

using Grid = std::vector<std::vector<std::string>>;

std::string Millis(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", ms);
    return buf;
}

Json GridToJson(const std::vector<std::string>& headers, const Grid& rows) {
    Json objects = Json::array();
    for (const auto& row : rows) {
        Json object = Json::object();
        const size_t n = std::min(headers.size(), row.size());
        for (size_t c = 0; c < n; ++c) object[headers[c]] = row[c];
        objects.push_back(std::move(object));
    }
    return objects;
}

// Columns separated by two spaces, header underlined with dashes. The last
// column is not padded.
void RenderPlainGrid(const std::vector<std::string>& headers, const Grid& rows,
                     std::ostream& out) {
    std::vector<size_t> widths;
    for (const auto& header : headers) widths.push_back(header.size());
    for (const auto& row : rows) {
        for (size_t c = 0; c < widths.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto line = [&](const std::vector<std::string>& cells) {
        std::string text;
        for (size_t c = 0; c < widths.size() && c < cells.size(); ++c) {
            if (c > 0) text += "  ";
            text += cells[c];
            if (c + 1 < widths.size()) text.append(widths[c] - cells[c].size(), ' ');
        }
        while (!text.empty() && text.back() == ' ') text.pop_back();
        out << text << "\n";
    };

    line(headers);
    std::vector<std::string> rule;
    for (size_t width : widths) rule.emplace_back(width, '-');
    line(rule);
    for (const auto& row : rows) line(row);
}

void RenderFtxuiGrid(const std::vector<std::string>& headers, const Grid& rows,
                     std::ostream& out) {
    Grid cells;
    cells.reserve(rows.size() + 1);
    cells.push_back(headers);
    cells.insert(cells.end(), rows.begin(), rows.end());

    auto table = ftxui::Table(cells);
    auto header = table.SelectRow(0);
    header.Decorate(ftxui::bold);
    header.SeparatorVertical(ftxui::LIGHT);
    header.BorderBottom(ftxui::LIGHT);

    auto element = table.Render();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
    ftxui::Render(screen, element);
    out << screen.ToString() << "\n";
}

// Field names across all documents, in first-seen order.
std::vector<std::string> FieldUnion(const Rows& rows) {
    std::vector<std::string> fields;
    for (const auto& row : rows) {
        for (const auto& entry : row) {
            if (std::find(fields.begin(), fields.end(), entry.first) == fields.end()) {
                fields.push_back(entry.first);
            }
        }
    }
    return fields;
}

} // anonymous namespace

std::string OutputFormatter::Styled(const char* code, const std::string& text) const {
    if (!color_mode_) return text;
    return std::string(code) + text + ansi::kReset;
}

void OutputFormatter::PrintTable(const std::vector<std::string>& headers,
                                 const std::vector<std::vector<std::string>>& rows) const {
    if (json_mode_) {
        out_ << GridToJson(headers, rows).dump() << "\n";
    } else if (color_mode_) {
        RenderFtxuiGrid(headers, rows, out_);
    } else {
        RenderPlainGrid(headers, rows, out_);
    }
}

void OutputFormatter::PrintRows(const Rows& rows) const {
    if (json_mode_) {
        PrintJson(RowsToJson(rows));
        return;
    }

    const auto fields = FieldUnion(rows);
    Grid cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<std::string> line;
        for (const auto& field : fields) {
            const Value* value = row.Find(field);
            line.push_back(value != nullptr ? value->ToDisplayString() : std::string{});
        }
        cells.push_back(std::move(line));
    }
    PrintTable(fields, cells);
}

void OutputFormatter::PrintResult(const FederatedResult& result) const {
    if (json_mode_) {
        PrintJson(FederatedResultToJson(result));
        return;
    }

    for (const auto& warning : result.warnings) PrintWarning(warning);
    if (!result.rows.empty()) PrintRows(result.rows);

    std::string summary = std::to_string(result.rows.size()) + " row(s) in " +
                          Millis(result.execution_time_ms) + " ms";
    if (result.cache_hit) summary += ", cached at " + FormatTimestamp(result.last_updated);
    if (result.next_update) summary += ", next refresh " + FormatTimestamp(*result.next_update);
    out_ << Styled(ansi::kDim, summary) << "\n";
}

void OutputFormatter::PrintJson(const Json& json) const {
    out_ << json.dump(2) << "\n";
}

void OutputFormatter::PrintWarning(const Error& warning) const {
    err_ << Styled(ansi::kYellow, "Warning:") << " " << warning.message;
    if (!warning.target.empty()) err_ << " (" << warning.target << ")";
    err_ << "\n";
}

// Error: <operation> [<category>]
//   <message>
//   <detail>
void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }
    err_ << Styled(ansi::kRed, "Error:") << " " << Styled(ansi::kBold, error.operation) << " "
         << Styled(ansi::kDim, "[" + error.CategoryName() + "]") << "\n";
    err_ << "  " << error.message << "\n";
    if (error.detail && !error.detail->empty()) {
        err_ << "  " << Styled(ansi::kDim, *error.detail) << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        Json body;
        body["success"] = true;
        body["message"] = message;
        out_ << body.dump() << "\n";
        return;
    }
    if (color_mode_) out_ << Styled(ansi::kGreen, "OK") << " ";
    out_ << message << "\n";
}

} // namespace docfed
