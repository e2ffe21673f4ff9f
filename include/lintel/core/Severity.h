#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lintel {

enum class Severity : uint8_t {
    Ignore        = 0,
    Informational = 1,
    Warning       = 2,
    Error         = 3,
    Fatal         = 4,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Ignore:        return "ignore";
        case Severity::Informational: return "informational";
        case Severity::Warning:       return "warning";
        case Severity::Error:         return "error";
        case Severity::Fatal:         return "fatal";
    }
    return "unknown";
}

constexpr std::optional<Severity> parseSeverity(std::string_view s) {
    if (s == "ignore")        return Severity::Ignore;
    if (s == "informational") return Severity::Informational;
    if (s == "warning")       return Severity::Warning;
    if (s == "error")         return Severity::Error;
    if (s == "fatal")         return Severity::Fatal;
    return std::nullopt;
}

constexpr bool operator>=(Severity a, Severity b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

} // namespace lintel
