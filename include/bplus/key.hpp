#ifndef BPLUS_KEY_HPP
#define BPLUS_KEY_HPP

#include <bplus/defs.hpp>
#include <bplus/schema.hpp>

#include <fmt/ostream.h>

#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace bplus {

/// The value of a single key column. The active alternative must match
/// the column's type: int32 -> i32, int64 -> i64, float32 -> float,
/// float64 -> double, fixed_string -> std::string.
using value = std::variant<i32, i64, float, double, std::string>;

/**
 * A composite key: one value per schema column, in schema order.
 *
 * Keys are always constructed against a schema and are checked to match it.
 * Fixed string values may be shorter than their column (they are padded with
 * zero bytes when encoded), but never longer, and they must not contain zero bytes.
 */
class key {
public:
    /// Constructs an empty key (matches no schema).
    key() = default;

    /// \throws bad_argument If the values do not match the schema.
    key(const schema& s, std::vector<value> values);

    key(const schema& s, std::initializer_list<value> values)
        : key(s, std::vector<value>(values)) {}

    u32 size() const { return static_cast<u32>(m_values.size()); }

    const value& operator[](u32 index) const { return m_values[index]; }

    const std::vector<value>& values() const { return m_values; }

    friend bool operator==(const key& lhs, const key& rhs) { return lhs.m_values == rhs.m_values; }
    friend bool operator!=(const key& lhs, const key& rhs) { return !(lhs == rhs); }

private:
    std::vector<value> m_values;
};

/// Throws a `bad_argument` exception if `k` does not match the given schema.
void check_key(const schema& s, const key& k);

/// Formats a single value for diagnostic output.
std::string format_value(const value& v);

std::ostream& operator<<(std::ostream& os, const key& k);

} // namespace bplus

#if FMT_VERSION >= 90000
template<>
struct fmt::formatter<bplus::key> : fmt::ostream_formatter {};
#endif

#endif // BPLUS_KEY_HPP
