#include <docfed/engine/federated_result.hpp>

namespace docfed {

Json FederatedResultToJson(const FederatedResult& result) {
    Json j;
    j["rows"] = RowsToJson(result.rows);
    j["execution_time_ms"] = result.execution_time_ms;
    j["cache_hit"] = result.cache_hit;
    j["last_updated"] = FormatTimestamp(result.last_updated);
    j["next_update"] = result.next_update ? Json(FormatTimestamp(*result.next_update))
                                          : Json(nullptr);
    Json warnings = Json::array();
    for (const auto& warning : result.warnings) {
        Json w;
        w["category"] = warning.CategoryName();
        w["message"] = warning.ToString();
        warnings.push_back(std::move(w));
    }
    j["warnings"] = std::move(warnings);
    return j;
}

} // namespace docfed
