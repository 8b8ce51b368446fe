#ifndef BPLUS_PAGE_HPP
#define BPLUS_PAGE_HPP

#include <bplus/assert.hpp>
#include <bplus/defs.hpp>
#include <bplus/file.hpp>
#include <bplus/key.hpp>
#include <bplus/node_kind.hpp>
#include <bplus/schema.hpp>
#include <bplus/serialization.hpp>

#include <vector>

namespace bplus {

/// Link value that points to no page. Page 0 holds the tree header
/// and is never the target of a link.
static constexpr u64 invalid_page = 0;

/// The common header at the start of every page.
struct page_header {
    u16 type = 0;     // Persisted tag of the node kind, see page_type().
    u32 capacity = 0; // Number of keys stored in the page.

    static constexpr auto get_binary_format() {
        return binary_format(&page_header::type, &page_header::capacity);
    }
};

/// Byte offset of the page with the given index.
inline u64 page_offset(u64 index, u32 page_size) {
    return index * page_size;
}

/// Number of bytes needed by a page of the given kind that holds `capacity`
/// keys of `key_size` bytes each.
u64 required_page_size(node_kind kind, u32 key_size, u32 capacity);

/// Returns the degree `d` of pages of the given kind, i.e. the largest `d` such that
/// `2d` keys (and their per-entry payload) fit into the page. Returns 0 if not even
/// a single entry fits.
u32 page_degree(node_kind kind, u32 page_size, u32 key_size);

namespace detail {

// Serializes a page into a zeroed, page sized buffer.
class page_writer {
public:
    explicit page_writer(u32 page_size)
        : m_data(page_size, 0) {}

    template<typename T>
    void put(const T& v) {
        BPLUS_ASSERT(serialized_size<T>() <= remaining(), "Page overflow.");
        serialize(v, m_data.data() + m_pos);
        m_pos += serialized_size<T>();
    }

    void put_key(const schema& s, const key& k);

    // Writes the page into the file, at the location of the page with the given index.
    void write(file& f, u64 index) const;

    size_t remaining() const { return m_data.size() - m_pos; }

private:
    std::vector<byte> m_data;
    size_t m_pos = 0;
};

// Reads a page from a file and deserializes its content in order.
class page_reader {
public:
    page_reader(file& f, u64 index, u32 page_size);

    template<typename T>
    T get() {
        check_remaining(serialized_size<T>());
        T v = deserialize<T>(m_data.data() + m_pos);
        m_pos += serialized_size<T>();
        return v;
    }

    key get_key(const schema& s);

    u64 index() const { return m_index; }

    size_t remaining() const { return m_data.size() - m_pos; }

private:
    void check_remaining(size_t n) const;

private:
    std::vector<byte> m_data;
    size_t m_pos = 0;
    u64 m_index = 0;
};

} // namespace detail

} // namespace bplus

#endif // BPLUS_PAGE_HPP
