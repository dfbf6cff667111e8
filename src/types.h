#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace datalens {

enum class ValueKind {
    Null,
    Number,
    Text,
    Bool
};

// Tagged scalar cell. Default-constructed values are Null.
class Value {
public:
    Value() = default;

    static auto Null() -> Value { return Value(); }
    static auto Number(double v) -> Value { return Value(Storage(std::in_place_index<1>, v)); }
    static auto Text(std::string v) -> Value { return Value(Storage(std::in_place_index<2>, std::move(v))); }
    static auto Bool(bool v) -> Value { return Value(Storage(std::in_place_index<3>, v)); }

    [[nodiscard]] auto kind() const -> ValueKind { return static_cast<ValueKind>(data_.index()); }
    [[nodiscard]] auto IsNull() const -> bool { return kind() == ValueKind::Null; }

    [[nodiscard]] auto AsNumber() const -> double { return std::get<1>(data_); }
    [[nodiscard]] auto AsText() const -> const std::string& { return std::get<2>(data_); }
    [[nodiscard]] auto AsBool() const -> bool { return std::get<3>(data_); }

    // Null, or text that is empty after trimming whitespace.
    [[nodiscard]] auto IsMissing() const -> bool;

    // Numbers as-is; text only when the whole trimmed string is a finite number.
    [[nodiscard]] auto TryNumber() const -> std::optional<double>;

    // Stable textual form used for duplicate detection and prompts.
    [[nodiscard]] auto ToKey() const -> std::string;

    friend auto operator==(const Value& a, const Value& b) -> bool { return a.data_ == b.data_; }
    friend auto operator!=(const Value& a, const Value& b) -> bool { return !(a == b); }

private:
    using Storage = std::variant<std::monostate, double, std::string, bool>;
    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

auto ValueKindToString(ValueKind kind) -> const char*;

using Row = std::vector<Value>;

// Rows are aligned with `columns`: row[i] is the cell of columns[i].
struct Dataset {
    std::vector<std::string> columns;
    std::vector<Row> rows;

    [[nodiscard]] auto RowCount() const -> size_t { return rows.size(); }
    [[nodiscard]] auto ColumnCount() const -> size_t { return columns.size(); }
    [[nodiscard]] auto ColumnIndex(const std::string& name) const -> std::optional<size_t> {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == name) return i;
        }
        return std::nullopt;
    }
};

struct AnalysisRequest {
    std::string dataset_name;
    long row_count_hint = 0;
    std::string requester_identity;
    std::shared_ptr<const Dataset> dataset;
};

} // namespace datalens
