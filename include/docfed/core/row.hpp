#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/value.hpp>

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// Row: one document: field names mapped to values, in insertion order.
// ---------------------------------------------------------------------------
class Row {
public:
    using Field = std::pair<std::string, Value>;

    Row() = default;
    Row(std::initializer_list<Field> fields);

    /// Pointer to the field's value, or nullptr when the field is absent.
    [[nodiscard]] const Value* Find(std::string_view name) const;
    [[nodiscard]] bool Contains(std::string_view name) const { return Find(name) != nullptr; }

    /// Insert or overwrite. Overwriting keeps the field's original position.
    void Set(std::string name, Value value);

    [[nodiscard]] size_t Size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return fields_.empty(); }
    [[nodiscard]] const std::vector<Field>& Fields() const noexcept { return fields_; }

    auto begin() const { return fields_.begin(); }
    auto end() const { return fields_.end(); }

    bool operator==(const Row& other) const { return fields_ == other.fields_; }
    bool operator!=(const Row& other) const { return !(*this == other); }

private:
    std::vector<Field> fields_;
};

using Rows = std::vector<Row>;

/// Collections available to one execution, keyed by collection name.
using CollectionMap = std::map<std::string, Rows>;

// ---------------------------------------------------------------------------
// FieldInfo: one entry of an inferred collection schema.
// ---------------------------------------------------------------------------
struct FieldInfo {
    std::string name;
    std::string type;  // "string", "number", "boolean", "timestamp", "object", "array", "null"

    bool operator==(const FieldInfo& other) const {
        return name == other.name && type == other.type;
    }
};

/// Union of the fields of all rows in first-seen order. A field's type is
/// taken from its first non-null occurrence; "null" if it is never set.
std::vector<FieldInfo> InferSchema(const Rows& rows);

Result<Row, Error> RowFromJson(const Json& json);
Json RowToJson(const Row& row);

/// Parse a JSON array of objects.
Result<Rows, Error> RowsFromJson(const Json& json);
Json RowsToJson(const Rows& rows);

Json SchemaToJson(const std::vector<FieldInfo>& schema);
Result<std::vector<FieldInfo>, Error> SchemaFromJson(const Json& json);

} // namespace docfed
