#include <docfed/core/row.hpp>

#include <algorithm>

namespace docfed {

Row::Row(std::initializer_list<Field> fields) {
    for (const auto& f : fields) {
        Set(f.first, f.second);
    }
}

const Value* Row::Find(std::string_view name) const {
    for (const auto& [key, value] : fields_) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

void Row::Set(std::string name, Value value) {
    for (auto& field : fields_) {
        if (field.first == name) {
            field.second = std::move(value);
            return;
        }
    }
    fields_.emplace_back(std::move(name), std::move(value));
}

std::vector<FieldInfo> InferSchema(const Rows& rows) {
    std::vector<FieldInfo> schema;
    for (const auto& row : rows) {
        for (const auto& [name, value] : row) {
            auto it = std::find_if(schema.begin(), schema.end(),
                                   [&name](const FieldInfo& f) { return f.name == name; });
            if (it == schema.end()) {
                schema.push_back(FieldInfo{name, value.TypeName()});
            } else if (it->type == "null" && !value.IsNull()) {
                it->type = value.TypeName();
            }
        }
    }
    return schema;
}

Result<Row, Error> RowFromJson(const Json& json) {
    if (!json.is_object()) {
        return Result<Row, Error>::Err(Error::Make(
            ErrorCategory::Internal, "RowFromJson", "",
            "Expected a JSON object, got " + std::string(json.type_name())));
    }
    Row row;
    for (auto it = json.begin(); it != json.end(); ++it) {
        row.Set(it.key(), ValueFromJson(it.value()));
    }
    return Result<Row, Error>::Ok(std::move(row));
}

Json RowToJson(const Row& row) {
    auto out = Json::object();
    for (const auto& [name, value] : row) {
        out[name] = ValueToJson(value);
    }
    return out;
}

Result<Rows, Error> RowsFromJson(const Json& json) {
    if (!json.is_array()) {
        return Result<Rows, Error>::Err(Error::Make(
            ErrorCategory::Internal, "RowsFromJson", "",
            "Expected a JSON array of documents, got " + std::string(json.type_name())));
    }
    Rows rows;
    rows.reserve(json.size());
    for (const auto& item : json) {
        auto row = RowFromJson(item);
        if (row.IsErr()) {
            return Result<Rows, Error>::Err(std::move(row).Error());
        }
        rows.push_back(std::move(row).Value());
    }
    return Result<Rows, Error>::Ok(std::move(rows));
}

Json RowsToJson(const Rows& rows) {
    auto out = Json::array();
    for (const auto& row : rows) {
        out.push_back(RowToJson(row));
    }
    return out;
}

Json SchemaToJson(const std::vector<FieldInfo>& schema) {
    auto out = Json::array();
    for (const auto& field : schema) {
        out.push_back({{"name", field.name}, {"type", field.type}});
    }
    return out;
}

Result<std::vector<FieldInfo>, Error> SchemaFromJson(const Json& json) {
    if (!json.is_array()) {
        return Result<std::vector<FieldInfo>, Error>::Err(Error::Make(
            ErrorCategory::Internal, "SchemaFromJson", "", "Expected a JSON array"));
    }
    std::vector<FieldInfo> schema;
    for (const auto& item : json) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
            return Result<std::vector<FieldInfo>, Error>::Err(Error::Make(
                ErrorCategory::Internal, "SchemaFromJson", "",
                "Schema entry must be an object with a string 'name'"));
        }
        schema.push_back(FieldInfo{item["name"].get<std::string>(),
                                   item.value("type", std::string("null"))});
    }
    return Result<std::vector<FieldInfo>, Error>::Ok(std::move(schema));
}

} // namespace docfed
