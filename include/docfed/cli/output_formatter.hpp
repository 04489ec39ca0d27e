#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/row.hpp>
#include <docfed/engine/federated_result.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for CLI commands.
//
// When color_mode is true and json_mode is false, tables render through
// FTXUI and messages use ANSI escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Table with string cells. In JSON mode, an array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Documents as a table whose columns are the union of their fields in
    // first-seen order. In JSON mode, the documents themselves.
    void PrintRows(const Rows& rows) const;

    // Rows plus a summary line and recovered warnings. In JSON mode, the
    // whole result object.
    void PrintResult(const FederatedResult& result) const;

    void PrintJson(const Json& json) const;

    void PrintError(const Error& error) const;

    void PrintSuccess(const std::string& message) const;

private:
    void PrintWarning(const Error& warning) const;
    // `text` wrapped in an escape code when color is on.
    std::string Styled(const char* code, const std::string& text) const;

    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace docfed
