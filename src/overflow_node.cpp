#include <bplus/overflow_node.hpp>

#include <fmt/ostream.h>

namespace bplus {

overflow_node::overflow_node(u64 index, const configuration& config)
    : node(node_kind::leaf_overflow, index, config) {}

void overflow_node::write(file& f) const {
    detail::page_writer w(config().page_size());
    write_header(w);
    w.put(m_next);
    w.put(m_prev);
    write_keys(w);
    w.write(f, index());
}

void overflow_node::read(detail::page_reader& r, u32 capacity) {
    m_next = r.get<u64>();
    m_prev = r.get<u64>();
    read_keys(r, capacity);
}

void overflow_node::print(std::ostream& os) const {
    fmt::print(os,
               "Overflow node @{}:\n"
               "  Next: @{}\n"
               "  Prev: @{}\n",
               index(), m_next, m_prev);
    print_keys(os);
}

lookup_overflow_node::lookup_overflow_node(u64 index, const configuration& config)
    : node(node_kind::lookup_overflow, index, config) {}

void lookup_overflow_node::write(file& f) const {
    detail::page_writer w(config().page_size());
    write_header(w);
    w.put(m_next);
    write_keys(w);
    w.write(f, index());
}

void lookup_overflow_node::read(detail::page_reader& r, u32 capacity) {
    m_next = r.get<u64>();
    read_keys(r, capacity);
}

void lookup_overflow_node::print(std::ostream& os) const {
    fmt::print(os, "Lookup overflow node @{}:\n  Next: @{}\n", index(), m_next);
    print_keys(os);
}

} // namespace bplus
