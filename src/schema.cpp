#include <bplus/schema.hpp>

#include <bplus/assert.hpp>
#include <bplus/exception.hpp>

#include <fmt/format.h>

#include <utility>

namespace bplus {

const char* to_string(column_type type) {
    switch (type) {
    case column_type::int32:
        return "int32";
    case column_type::int64:
        return "int64";
    case column_type::float32:
        return "float32";
    case column_type::float64:
        return "float64";
    case column_type::fixed_string:
        return "fixed_string";
    }
    BPLUS_UNREACHABLE("invalid column type");
}

column column::fixed_string(u32 width) {
    if (width == 0)
        BPLUS_THROW(bad_argument("Fixed string columns must be at least one byte wide."));
    if (width > max_key_size)
        BPLUS_THROW(bad_argument(fmt::format(
            "Fixed string column width {} exceeds the maximum key size of {} bytes.", width,
            max_key_size)));
    return column(column_type::fixed_string, width);
}

std::ostream& operator<<(std::ostream& os, const column& col) {
    if (col.type() == column_type::fixed_string)
        return os << to_string(col.type()) << "(" << col.width() << ")";
    return os << to_string(col.type());
}

schema::schema(std::vector<column> columns)
    : m_columns(std::move(columns)) {
    if (m_columns.empty())
        BPLUS_THROW(bad_argument("A schema must have at least one column."));

    u64 size = 0;
    for (const column& col : m_columns)
        size += col.width();
    if (size > max_key_size)
        BPLUS_THROW(bad_argument(fmt::format(
            "Encoded keys would be {} bytes long, the maximum is {} bytes.", size, max_key_size)));
    m_key_size = static_cast<u32>(size);
}

std::ostream& operator<<(std::ostream& os, const schema& s) {
    os << "[";
    for (u32 i = 0; i < s.size(); ++i) {
        if (i > 0)
            os << ", ";
        os << s[i];
    }
    return os << "]";
}

} // namespace bplus
