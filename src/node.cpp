#include <bplus/node.hpp>

#include <bplus/assert.hpp>
#include <bplus/capacity.hpp>
#include <bplus/exception.hpp>
#include <bplus/key_codec.hpp>
#include <bplus/page.hpp>

#include <fmt/ostream.h>

#include <utility>

namespace bplus {

deletion_scope::deletion_scope(node& n)
    : m_node(&n)
    , m_previous(n.m_being_deleted) {
    n.m_being_deleted = true;
}

deletion_scope::deletion_scope(deletion_scope&& other) noexcept
    : m_node(std::exchange(other.m_node, nullptr))
    , m_previous(other.m_previous) {}

deletion_scope::~deletion_scope() {
    if (!m_node || m_previous)
        return;

    // An abandoned phase only ends if the node is stable again.
    // Otherwise it stays relaxed until it is refilled and settled.
    const node& n = *m_node;
    const i64 capacity = n.m_capacity;
    if (capacity >= min_capacity(n.m_kind, n.config())
        && capacity <= max_capacity(n.m_kind, n.config()))
        m_node->m_being_deleted = false;
}

void deletion_scope::finish() {
    if (!m_node)
        BPLUS_THROW(bad_operation("The deletion phase has already been finished."));

    validate_capacity(m_node->m_kind, m_node->m_capacity, false, m_node->config());
    m_node->m_being_deleted = false;
    m_node = nullptr;
}

node::node(node_kind kind, u64 index, const configuration& config)
    : m_config(&config)
    , m_kind(kind)
    , m_index(index) {}

node::~node() {}

void node::set_kind(node_kind kind) {
    if (!can_transition(m_kind, kind)) {
        BPLUS_THROW(bad_kind_transition(
            fmt::format("Cannot convert a {} node into a {} node.", m_kind, kind)));
    }

    validate_capacity(kind, m_capacity, m_being_deleted, config());
    m_kind = kind;
}

bool node::is_full() const {
    return bplus::is_full(m_kind, m_capacity, config());
}

bool node::is_time_to_merge() const {
    return bplus::is_time_to_merge(m_kind, m_capacity, config());
}

const key& node::get(u32 index) const {
    check_index(index);
    return m_keys[index];
}

const key& node::first() const {
    if (m_keys.empty())
        BPLUS_THROW(bad_operation("The node is empty."));
    return m_keys.front();
}

const key& node::last() const {
    if (m_keys.empty())
        BPLUS_THROW(bad_operation("The node is empty."));
    return m_keys.back();
}

void node::set(u32 index, key k) {
    check_index(index);
    check_key(config().schema(), k);
    m_keys[index] = std::move(k);
}

void node::insert(u32 index, key k) {
    if (index > size()) {
        BPLUS_THROW(bad_argument(
            fmt::format("Insertion index {} is out of bounds (size is {}).", index, size())));
    }
    check_key(config().schema(), k);
    check_capacity(i64(m_capacity) + 1);

    m_keys.insert(m_keys.begin() + index, std::move(k));
    ++m_capacity;
}

void node::push_front(key k) {
    insert(0, std::move(k));
}

void node::push_back(key k) {
    insert(size(), std::move(k));
}

key node::pop_front() {
    check_capacity(i64(m_capacity) - 1);

    key k = std::move(m_keys.front());
    m_keys.pop_front();
    --m_capacity;
    return k;
}

key node::pop_back() {
    check_capacity(i64(m_capacity) - 1);

    key k = std::move(m_keys.back());
    m_keys.pop_back();
    --m_capacity;
    return k;
}

key node::remove(u32 index) {
    check_index(index);
    check_capacity(i64(m_capacity) - 1);

    key k = std::move(m_keys[index]);
    m_keys.erase(m_keys.begin() + index);
    --m_capacity;
    return k;
}

deletion_scope node::begin_deletion() {
    return deletion_scope(*this);
}

void node::settle() {
    validate_capacity(m_kind, m_capacity, false, config());
    m_being_deleted = false;
}

void node::validate() const {
    if (m_capacity != m_keys.size()) {
        BPLUS_THROW(invalid_tree_state(
            fmt::format("Node @{} has a capacity of {} but holds {} keys.", m_index, m_capacity,
                        m_keys.size())));
    }
    check_capacity(m_capacity);
}

void node::write_header(detail::page_writer& w) const {
    validate();

    page_header header;
    header.type = page_type();
    header.capacity = m_capacity;
    w.put(header);
}

void node::write_keys(detail::page_writer& w) const {
    for (const key& k : m_keys)
        w.put_key(config().schema(), k);
}

void node::read_keys(detail::page_reader& r, u32 count) {
    for (u32 i = 0; i < count; ++i)
        push_back(r.get_key(config().schema()));
}

void node::print_keys(std::ostream& os) const {
    fmt::print(os, "  Keys: {}\n", m_capacity);
    for (u32 i = 0; i < size(); ++i)
        fmt::print(os, "    {}: {}\n", i, format_key(config().schema(), m_keys[i]));
}

void node::check_capacity(i64 capacity) const {
    validate_capacity(m_kind, capacity, m_being_deleted, config());
}

void node::check_index(u32 index) const {
    if (index >= size()) {
        BPLUS_THROW(
            bad_argument(fmt::format("Key index {} is out of bounds (size is {}).", index, size())));
    }
}

} // namespace bplus
