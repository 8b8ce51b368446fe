#ifndef BPLUS_SCHEMA_HPP
#define BPLUS_SCHEMA_HPP

#include <bplus/defs.hpp>

#include <fmt/ostream.h>

#include <initializer_list>
#include <ostream>
#include <vector>

namespace bplus {

/// The type of a single key column.
enum class column_type {
    int32,
    int64,
    float32,
    float64,
    fixed_string,
};

const char* to_string(column_type type);

/**
 * Describes one column of a composite key: its type and its encoded width in bytes.
 * Numeric columns have the natural width of their type, fixed string
 * columns have an explicit width chosen by the user.
 */
class column {
public:
    static column int32() { return column(column_type::int32, 4); }
    static column int64() { return column(column_type::int64, 8); }
    static column float32() { return column(column_type::float32, 4); }
    static column float64() { return column(column_type::float64, 8); }

    /// A string column that occupies exactly `width` bytes on disk.
    /// Shorter strings are padded with zero bytes.
    ///
    /// \throws bad_argument If `width` is zero or larger than `max_key_size`.
    static column fixed_string(u32 width);

    column_type type() const { return m_type; }

    /// Number of bytes occupied by this column in an encoded key.
    u32 width() const { return m_width; }

    friend bool operator==(const column& lhs, const column& rhs) {
        return lhs.m_type == rhs.m_type && lhs.m_width == rhs.m_width;
    }

    friend bool operator!=(const column& lhs, const column& rhs) { return !(lhs == rhs); }

private:
    column(column_type type, u32 width)
        : m_type(type)
        , m_width(width) {}

private:
    column_type m_type;
    u32 m_width;
};

std::ostream& operator<<(std::ostream& os, const column& col);

/**
 * The ordered list of columns shared by every key of a tree.
 * Schemas are immutable once constructed.
 */
class schema {
public:
    /// \throws bad_argument If there are no columns or if the encoded
    ///         key would be larger than `max_key_size`.
    explicit schema(std::vector<column> columns);

    schema(std::initializer_list<column> columns)
        : schema(std::vector<column>(columns)) {}

    /// Number of columns.
    u32 size() const { return static_cast<u32>(m_columns.size()); }

    const column& operator[](u32 index) const { return m_columns[index]; }

    const std::vector<column>& columns() const { return m_columns; }

    /// Size of an encoded key, in bytes (the sum of all column widths).
    u32 key_size() const { return m_key_size; }

    friend bool operator==(const schema& lhs, const schema& rhs) {
        return lhs.m_columns == rhs.m_columns;
    }

    friend bool operator!=(const schema& lhs, const schema& rhs) { return !(lhs == rhs); }

private:
    std::vector<column> m_columns;
    u32 m_key_size = 0;
};

std::ostream& operator<<(std::ostream& os, const schema& s);

} // namespace bplus

#if FMT_VERSION >= 90000
template<>
struct fmt::formatter<bplus::column> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<bplus::schema> : fmt::ostream_formatter {};
#endif

#endif // BPLUS_SCHEMA_HPP
