#include "dataset.h"

#include <stdexcept>
#include <unordered_map>

#include "errors.h"

namespace datalens {

auto ValueFromJson(const nlohmann::json& j, size_t row_index) -> Value {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return Value::Null();
        case nlohmann::json::value_t::boolean:
            return Value::Bool(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return Value::Number(j.get<double>());
        case nlohmann::json::value_t::string:
            return Value::Text(j.get<std::string>());
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
        case nlohmann::json::value_t::binary:
            break;
    }
    throw MalformedRowError(row_index, std::string("non-scalar cell of type ") + j.type_name());
}

auto DatasetFromJsonRows(const nlohmann::json& rows) -> Dataset {
    if (!rows.is_array()) {
        throw std::invalid_argument("rows must be an array of objects");
    }

    Dataset ds;
    std::unordered_map<std::string, size_t> index;
    for (size_t r = 0; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (!row.is_object()) {
            throw MalformedRowError(r, std::string("expected an object, got ") + row.type_name());
        }
        for (auto it = row.begin(); it != row.end(); ++it) {
            if (index.emplace(it.key(), ds.columns.size()).second) {
                ds.columns.push_back(it.key());
            }
        }
    }

    ds.rows.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
        Row out(ds.columns.size());
        for (auto it = rows[r].begin(); it != rows[r].end(); ++it) {
            out[index.at(it.key())] = ValueFromJson(it.value(), r);
        }
        ds.rows.push_back(std::move(out));
    }
    return ds;
}

auto ValueToJson(const Value& value) -> nlohmann::json {
    switch (value.kind()) {
        case ValueKind::Null:
            return nullptr;
        case ValueKind::Number:
            return value.AsNumber();
        case ValueKind::Text:
            return value.AsText();
        case ValueKind::Bool:
            return value.AsBool();
    }
    return nullptr;
}

} // namespace datalens
