#include <bplus/page.hpp>

#include <bplus/exception.hpp>
#include <bplus/key_codec.hpp>

#include <fmt/format.h>

namespace bplus {

namespace {

struct page_layout {
    u32 overhead = 0; // Fixed bytes per page, including the common header.
    u32 entry = 0;    // Bytes per key, including per-entry payload.
};

constexpr u32 link_size = serialized_size<u64>();

page_layout layout_of(node_kind kind, u32 key_size) {
    const u32 header = serialized_size<page_header>();
    switch (kind) {
    case node_kind::leaf:
    case node_kind::root_leaf:
    case node_kind::leaf_overflow:
        // Next and previous links.
        return {header + 2 * link_size, key_size};
    case node_kind::internal:
    case node_kind::root_internal:
        // n keys have n + 1 children.
        return {header + link_size, key_size + link_size};
    case node_kind::lookup_overflow:
        // Next link only.
        return {header + link_size, key_size};
    }
    BPLUS_UNREACHABLE("invalid node kind");
}

} // namespace

u64 required_page_size(node_kind kind, u32 key_size, u32 capacity) {
    const page_layout layout = layout_of(kind, key_size);
    return u64(layout.overhead) + u64(layout.entry) * capacity;
}

u32 page_degree(node_kind kind, u32 page_size, u32 key_size) {
    const page_layout layout = layout_of(kind, key_size);
    if (page_size <= layout.overhead)
        return 0;
    return (page_size - layout.overhead) / (2 * layout.entry);
}

namespace detail {

void page_writer::put_key(const schema& s, const key& k) {
    BPLUS_ASSERT(s.key_size() <= remaining(), "Page overflow.");
    m_pos += encode_key(s, k, m_data.data() + m_pos, remaining());
}

void page_writer::write(file& f, u64 index) const {
    f.write(page_offset(index, static_cast<u32>(m_data.size())), m_data.data(),
            static_cast<u32>(m_data.size()));
}

page_reader::page_reader(file& f, u64 index, u32 page_size)
    : m_data(page_size)
    , m_index(index) {
    f.read(page_offset(index, page_size), m_data.data(), page_size);
}

key page_reader::get_key(const schema& s) {
    key k = decode_key(s, m_data.data() + m_pos, remaining());
    m_pos += s.key_size();
    return k;
}

void page_reader::check_remaining(size_t n) const {
    if (n > remaining()) {
        BPLUS_THROW(corruption_error(
            fmt::format("Page {} is truncated: {} more bytes expected.", m_index, n)));
    }
}

} // namespace detail

} // namespace bplus
