#ifndef BPLUS_NODE_HPP
#define BPLUS_NODE_HPP

#include <bplus/configuration.hpp>
#include <bplus/defs.hpp>
#include <bplus/file.hpp>
#include <bplus/key.hpp>
#include <bplus/node_kind.hpp>

#include <deque>
#include <memory>
#include <ostream>

namespace bplus {

namespace detail {

class page_reader;
class page_writer;

} // namespace detail

class node;

/**
 * Relaxes the minimum capacity rule of a node while a multi-step removal
 * (e.g. borrowing keys from a sibling) is in progress.
 *
 * Obtained from `node::begin_deletion()`. Calling `finish()` checks the strict
 * capacity rules again and ends the deletion phase. If the scope is destroyed
 * without a successful `finish()`, the node returns to its previous phase only if
 * it satisfies the strict rules of its kind. A node that is still below its minimum
 * stays in the deletion phase until it is refilled and settled.
 */
class deletion_scope {
public:
    deletion_scope(deletion_scope&& other) noexcept;
    ~deletion_scope();

    /// Ends the deletion phase.
    ///
    /// \throws invalid_tree_state If the node holds fewer keys than the minimum
    ///         of its kind. The deletion phase remains active in that case.
    void finish();

    /// True until `finish()` has completed successfully.
    bool active() const { return m_node != nullptr; }

    deletion_scope(const deletion_scope&) = delete;
    deletion_scope& operator=(const deletion_scope&) = delete;
    deletion_scope& operator=(deletion_scope&&) = delete;

private:
    friend class node;

    explicit deletion_scope(node& n);

private:
    node* m_node = nullptr;
    bool m_previous = false;
};

/**
 * The in-memory representation of a single page of the tree.
 *
 * A node has a kind, the index of its page, and an ordered list of keys.
 * Its capacity (the number of keys) is checked against the rules of its kind
 * before every operation that changes it: an operation that would leave
 * the node in an invalid state throws `invalid_tree_state` and does not modify the node.
 *
 * Nodes are born in the deletion phase (see `being_deleted()`): the minimum capacity
 * rule does not apply until `settle()` has been called, so that a fresh node can be
 * filled one key at a time.
 *
 * Concrete subclasses implement the page layout of their kind.
 */
class node {
public:
    using key_list = std::deque<key>;

public:
    virtual ~node();

    node(const node&) = delete;
    node& operator=(const node&) = delete;

    const configuration& config() const { return *m_config; }

    node_kind kind() const { return m_kind; }

    /// Retags this node. Only leaf <-> root leaf and internal <-> root internal
    /// are legal transitions.
    ///
    /// \throws bad_kind_transition If the transition is not legal.
    /// \throws invalid_tree_state If the current capacity violates the rules of the new kind.
    void set_kind(node_kind kind);

    /// The persisted tag of this node's kind.
    u16 page_type() const { return bplus::page_type(m_kind); }

    bool is_leaf() const { return bplus::is_leaf(m_kind); }
    bool is_internal() const { return bplus::is_internal(m_kind); }
    bool is_root() const { return bplus::is_root(m_kind); }
    bool is_overflow() const { return bplus::is_overflow(m_kind); }
    bool is_lookup_overflow() const { return bplus::is_lookup_overflow(m_kind); }

    u64 index() const { return m_index; }
    void set_index(u64 index) { m_index = index; }

    /// Number of keys, as tracked by the capacity counter.
    u32 capacity() const { return m_capacity; }

    /// Number of keys in the key list.
    u32 size() const { return static_cast<u32>(m_keys.size()); }

    bool is_empty() const { return m_capacity == 0; }

    bool is_full() const;
    bool is_time_to_merge() const;

    const key& get(u32 index) const;
    const key& first() const;
    const key& last() const;
    const key_list& keys() const { return m_keys; }

    /// Replaces the key at the given index.
    void set(u32 index, key k);

    /// Inserts a key at the given index, shifting the following keys to the right.
    void insert(u32 index, key k);

    void push_front(key k);
    void push_back(key k);

    key pop_front();
    key pop_back();

    /// Removes the key at the given index, shifting the following keys to the left.
    key remove(u32 index);

    /// True while the minimum capacity rule is relaxed.
    bool being_deleted() const { return m_being_deleted; }

    /// Starts a deletion phase.
    deletion_scope begin_deletion();

    /// Ends the initial phase of a fresh node (or any other deletion phase)
    /// after checking the strict capacity rules.
    ///
    /// \throws invalid_tree_state If the node holds fewer keys than the minimum of its kind.
    void settle();

    /// Checks the capacity rules and the consistency of the capacity counter.
    ///
    /// \throws invalid_tree_state If the node is invalid.
    void validate() const;

    /// Writes this node into its page in the given file.
    virtual void write(file& f) const = 0;

    /// Prints a human readable description of this node.
    virtual void print(std::ostream& os) const = 0;

protected:
    node(node_kind kind, u64 index, const configuration& config);

    // Writes the common page header.
    void write_header(detail::page_writer& w) const;

    // Writes all keys in order.
    void write_keys(detail::page_writer& w) const;

    // Reads `count` keys from the page and appends them.
    void read_keys(detail::page_reader& r, u32 count);

    // Prints the common part of the node description.
    void print_keys(std::ostream& os) const;

    // Restores the layout specific part of the node from a page whose header
    // has already been consumed.
    virtual void read(detail::page_reader& r, u32 capacity) = 0;

private:
    friend deletion_scope;
    friend std::unique_ptr<node> read_node(file& f, u64 index, const configuration& config);

    void check_capacity(i64 capacity) const;
    void check_index(u32 index) const;

private:
    const configuration* m_config;
    node_kind m_kind;
    u64 m_index = 0;
    key_list m_keys;
    u32 m_capacity = 0;
    bool m_being_deleted = true;
};

} // namespace bplus

#endif // BPLUS_NODE_HPP
