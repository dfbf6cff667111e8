#include "types.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace datalens {

namespace {

auto Trim(const std::string& s) -> std::string {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

auto Value::IsMissing() const -> bool {
    if (IsNull()) return true;
    if (kind() == ValueKind::Text) return Trim(AsText()).empty();
    return false;
}

auto Value::TryNumber() const -> std::optional<double> {
    switch (kind()) {
        case ValueKind::Number:
            return AsNumber();
        case ValueKind::Text: {
            std::string t = Trim(AsText());
            if (t.empty()) return std::nullopt;
            // Plain decimal only: no hex, inf or nan, and '.' whatever the locale.
            std::istringstream iss(t);
            iss.imbue(std::locale::classic());
            double v = 0.0;
            if (!(iss >> v) || iss.peek() != std::char_traits<char>::eof() || !std::isfinite(v)) {
                return std::nullopt;
            }
            return v;
        }
        case ValueKind::Null:
        case ValueKind::Bool:
            return std::nullopt;
    }
    return std::nullopt;
}

auto Value::ToKey() const -> std::string {
    switch (kind()) {
        case ValueKind::Null:
            return "n:";
        case ValueKind::Number: {
            double v = AsNumber();
            if (v == 0.0) v = 0.0; // -0 and 0 compare equal
            std::ostringstream oss;
            oss.imbue(std::locale::classic());
            oss << std::setprecision(17) << v;
            return "d:" + oss.str();
        }
        case ValueKind::Text:
            return "s:" + std::to_string(AsText().size()) + ":" + AsText();
        case ValueKind::Bool:
            return AsBool() ? "b:1" : "b:0";
    }
    return "n:";
}

auto ValueKindToString(ValueKind kind) -> const char* {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Number:
            return "number";
        case ValueKind::Text:
            return "text";
        case ValueKind::Bool:
            return "bool";
    }
    return "null";
}

} // namespace datalens
