#include <bplus/key.hpp>

#include <bplus/assert.hpp>
#include <bplus/exception.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace bplus {

namespace {

// Index of the value alternative that represents the given column type.
size_t alternative_for(column_type type) {
    switch (type) {
    case column_type::int32:
        return 0;
    case column_type::int64:
        return 1;
    case column_type::float32:
        return 2;
    case column_type::float64:
        return 3;
    case column_type::fixed_string:
        return 4;
    }
    BPLUS_UNREACHABLE("invalid column type");
}

void check_values(const schema& s, const std::vector<value>& values) {
    if (values.size() != s.size()) {
        BPLUS_THROW(bad_argument(fmt::format("Key has {} values but the schema has {} columns.",
                                             values.size(), s.size())));
    }

    for (u32 i = 0; i < s.size(); ++i) {
        const column& col = s[i];
        const value& v = values[i];
        if (v.index() != alternative_for(col.type())) {
            BPLUS_THROW(bad_argument(
                fmt::format("Value of column {} does not match the column type {}.", i, col)));
        }

        if (col.type() == column_type::fixed_string) {
            const std::string& str = std::get<std::string>(v);
            if (str.size() > col.width()) {
                BPLUS_THROW(bad_argument(
                    fmt::format("String of {} bytes does not fit into column {} ({} bytes).",
                                str.size(), i, col.width())));
            }
            if (std::find(str.begin(), str.end(), '\0') != str.end()) {
                BPLUS_THROW(bad_argument(
                    fmt::format("String in column {} contains an embedded zero byte.", i)));
            }
        }
    }
}

} // namespace

key::key(const schema& s, std::vector<value> values)
    : m_values(std::move(values)) {
    check_values(s, m_values);
}

void check_key(const schema& s, const key& k) {
    check_values(s, k.values());
}

std::string format_value(const value& v) {
    return std::visit([](const auto& x) { return fmt::format("{}", x); }, v);
}

std::ostream& operator<<(std::ostream& os, const key& k) {
    os << "(";
    for (u32 i = 0; i < k.size(); ++i) {
        if (i > 0)
            os << ", ";
        os << format_value(k[i]);
    }
    return os << ")";
}

} // namespace bplus
