#ifndef BPLUS_OVERFLOW_NODE_HPP
#define BPLUS_OVERFLOW_NODE_HPP

#include <bplus/defs.hpp>
#include <bplus/node.hpp>
#include <bplus/page.hpp>

namespace bplus {

// Continuation page for a run of equal keys that does not fit into its leaf.
// Overflow pages form a doubly linked chain.
//
// Page layout:
// - Header (type, capacity)
// - Next overflow page (u64)
// - Previous overflow page (u64), or the owning leaf for the first page of a chain
// - Array of keys (capacity)
class overflow_node final : public node {
public:
    overflow_node(u64 index, const configuration& config);

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

// Continuation page of a lookup structure. Lookup overflow pages
// form a singly linked chain.
//
// Page layout:
// - Header (type, capacity)
// - Next lookup overflow page (u64)
// - Array of keys (capacity)
class lookup_overflow_node final : public node {
public:
    lookup_overflow_node(u64 index, const configuration& config);

    u64 next() const { return m_next; }
    void set_next(u64 index) { m_next = index; }

    void write(file& f) const override;
    void print(std::ostream& os) const override;

private:
    void read(detail::page_reader& r, u32 capacity) override;

private:
    u64 m_next = invalid_page;
};

} // namespace bplus

#endif // BPLUS_OVERFLOW_NODE_HPP
