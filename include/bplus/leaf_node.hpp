#ifndef BPLUS_LEAF_NODE_HPP
#define BPLUS_LEAF_NODE_HPP

#include <bplus/defs.hpp>
#include <bplus/node.hpp>
#include <bplus/page.hpp>

namespace bplus {

// Page layout:
// - Header (type, capacity)
// - Next leaf (u64)
// - Previous leaf (u64)
// - Array of keys (capacity)
//
// Keys are ordered. Leaf entries are complete index entries, record data
// is part of the trailing key columns.
class leaf_node final : public node {
public:
    /// \throws bad_argument If `kind` is neither `leaf` nor `root_leaf`.
    leaf_node(node_kind kind, u64 index, const configuration& config);

    u64 next() const { return m_next; }
    void set_next(u64 index) { m_next = index; }

    u64 prev() const { return m_prev; }
    void set_prev(u64 index) { m_prev = index; }

    void write(file& f) const override;
    void print(std::ostream& os) const override;

private:
    void read(detail::page_reader& r, u32 capacity) override;

private:
    u64 m_next = invalid_page;
    u64 m_prev = invalid_page;
};

} // namespace bplus

#endif // BPLUS_LEAF_NODE_HPP
