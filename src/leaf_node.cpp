#include <bplus/leaf_node.hpp>

#include <bplus/exception.hpp>

#include <fmt/ostream.h>

namespace bplus {

leaf_node::leaf_node(node_kind kind, u64 index, const configuration& config)
    : node(kind, index, config) {
    if (kind != node_kind::leaf && kind != node_kind::root_leaf)
        BPLUS_THROW(bad_argument(fmt::format("Invalid kind for a leaf node: {}.", kind)));
}

void leaf_node::write(file& f) const {
    detail::page_writer w(config().page_size());
    write_header(w);
    w.put(m_next);
    w.put(m_prev);
    write_keys(w);
    w.write(f, index());
}

void leaf_node::read(detail::page_reader& r, u32 capacity) {
    m_next = r.get<u64>();
    m_prev = r.get<u64>();
    read_keys(r, capacity);
}

void leaf_node::print(std::ostream& os) const {
    fmt::print(os,
               "Leaf node @{} ({}):\n"
               "  Next: @{}\n"
               "  Prev: @{}\n",
               index(), kind(), m_next, m_prev);
    print_keys(os);
}

} // namespace bplus
