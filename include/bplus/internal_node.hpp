#ifndef BPLUS_INTERNAL_NODE_HPP
#define BPLUS_INTERNAL_NODE_HPP

#include <bplus/defs.hpp>
#include <bplus/node.hpp>
#include <bplus/page.hpp>

#include <vector>

namespace bplus {

// Page layout:
// - Header (type, capacity)
// - Child 0 (u64)
// - `capacity` pairs of (key i, child i + 1)
//
// An internal node with N keys has N + 1 children. Child i contains the
// keys <= key i, the last child contains the keys greater than the last key.
// A node without keys has at most one child (a root that is about to collapse).
class internal_node final : public node {
public:
    /// \throws bad_argument If `kind` is neither `internal` nor `root_internal`.
    internal_node(node_kind kind, u64 index, const configuration& config);

    u32 child_count() const { return static_cast<u32>(m_children.size()); }

    u64 child(u32 index) const;
    void set_child(u32 index, u64 page);

    /// Inserts a child pointer at the given index, shifting the following children
    /// to the right. Children are not tied to the capacity of the node, but writing
    /// the node requires exactly `capacity() + 1` children (or at most one child if
    /// the node has no keys).
    void insert_child(u32 index, u64 page);

    /// Removes the child pointer at the given index.
    u64 remove_child(u32 index);

    const std::vector<u64>& children() const { return m_children; }

    void write(file& f) const override;
    void print(std::ostream& os) const override;

private:
    void read(detail::page_reader& r, u32 capacity) override;

    void check_child_index(u32 index, u32 size) const;

private:
    std::vector<u64> m_children;
};

} // namespace bplus

#endif // BPLUS_INTERNAL_NODE_HPP
