#pragma once

#include <array>
#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// A quantity cell. Empty optional means the cell was blank or not a number.
using Quantity = std::optional<double>;

inline std::string_view trim_view(std::string_view s) noexcept {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) --e;
    return s.substr(b, e - b);
}

// Non-numeric text, NaN and infinities all parse as absent; this never fails.
inline Quantity parse_quantity(std::string_view text) noexcept {
    std::string_view s = trim_view(text);
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
    }
    if (s.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (res.ec != std::errc{} || res.ptr != s.data() + s.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// The single "no usable quantity" predicate: blank, unparseable or zero.
inline bool is_absent_quantity(const Quantity& q) noexcept {
    return !q.has_value() || *q == 0.0;
}

// Shortest round-trip text: 120 -> "120", 12.5 -> "12.5".
inline std::string format_quantity(double value) {
    std::array<char, 64> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (res.ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buf.data(), res.ptr);
}

inline std::string format_quantity(const Quantity& q) {
    return q ? format_quantity(*q) : std::string("blank");
}

} // namespace core
