#pragma once

#include <nlohmann/json.hpp>

#include "types.h"

namespace datalens {

// Scalars map to their tag; arrays and objects throw MalformedRowError.
auto ValueFromJson(const nlohmann::json& j, size_t row_index) -> Value;

// Builds a Dataset from an array of row objects. The column set is the
// union of all row keys in first-seen order; absent keys become Null.
auto DatasetFromJsonRows(const nlohmann::json& rows) -> Dataset;

auto ValueToJson(const Value& value) -> nlohmann::json;

} // namespace datalens
