#include <bplus/internal_node.hpp>

#include <bplus/exception.hpp>
#include <bplus/key_codec.hpp>

#include <fmt/ostream.h>

namespace bplus {

internal_node::internal_node(node_kind kind, u64 index, const configuration& config)
    : node(kind, index, config) {
    if (!bplus::is_internal(kind))
        BPLUS_THROW(bad_argument(fmt::format("Invalid kind for an internal node: {}.", kind)));
}

u64 internal_node::child(u32 index) const {
    check_child_index(index, child_count());
    return m_children[index];
}

void internal_node::set_child(u32 index, u64 page) {
    check_child_index(index, child_count());
    m_children[index] = page;
}

void internal_node::insert_child(u32 index, u64 page) {
    check_child_index(index, child_count() + 1);
    if (child_count() > config().max_internal_capacity()) {
        BPLUS_THROW(invalid_tree_state(
            fmt::format("Exceeded the maximum number of children ({}) in node @{}.",
                        config().max_internal_capacity() + 1, this->index())));
    }
    m_children.insert(m_children.begin() + index, page);
}

u64 internal_node::remove_child(u32 index) {
    check_child_index(index, child_count());
    u64 page = m_children[index];
    m_children.erase(m_children.begin() + index);
    return page;
}

void internal_node::write(file& f) const {
    const u32 expected = capacity() + 1;
    if (capacity() == 0 ? child_count() > 1 : child_count() != expected) {
        BPLUS_THROW(invalid_tree_state(
            fmt::format("Internal node @{} has {} keys but {} children.", index(), capacity(),
                        child_count())));
    }

    detail::page_writer w(config().page_size());
    write_header(w);
    w.put(m_children.empty() ? invalid_page : m_children[0]);
    for (u32 i = 0; i < capacity(); ++i) {
        w.put_key(config().schema(), get(i));
        w.put(m_children[i + 1]);
    }
    w.write(f, index());
}

void internal_node::read(detail::page_reader& r, u32 capacity) {
    const u64 first = r.get<u64>();
    if (capacity > 0 || first != invalid_page)
        m_children.push_back(first);

    for (u32 i = 0; i < capacity; ++i) {
        push_back(r.get_key(config().schema()));
        m_children.push_back(r.get<u64>());
    }
}

void internal_node::print(std::ostream& os) const {
    fmt::print(os,
               "Internal node @{} ({}):\n"
               "  Children: {}\n",
               index(), kind(), child_count());
    for (u32 i = 0; i < child_count(); ++i) {
        if (i < capacity()) {
            fmt::print(os, "    {}: @{} (<= {})\n", i, m_children[i],
                       format_key(config().schema(), get(i)));
        } else {
            fmt::print(os, "    {}: @{}\n", i, m_children[i]);
        }
    }
    print_keys(os);
}

void internal_node::check_child_index(u32 index, u32 size) const {
    if (index >= size) {
        BPLUS_THROW(bad_argument(
            fmt::format("Child index {} is out of bounds (size is {}).", index, size)));
    }
}

} // namespace bplus
