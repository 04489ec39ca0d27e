#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/row.hpp>

#include <optional>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// FederatedResult: rows of one federated query plus execution metadata.
// ---------------------------------------------------------------------------
struct FederatedResult {
    Rows rows;
    double execution_time_ms = 0.0;
    bool cache_hit = false;
    Timestamp last_updated;
    std::optional<Timestamp> next_update;  // materialized only
    std::vector<Error> warnings;           // degradations that were recovered
};

/// {"rows": [...], "execution_time_ms", "cache_hit", "last_updated",
///  "next_update" (or null), "warnings": [{category, message}, ...]}
Json FederatedResultToJson(const FederatedResult& result);

} // namespace docfed
