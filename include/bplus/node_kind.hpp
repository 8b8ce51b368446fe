#ifndef BPLUS_NODE_KIND_HPP
#define BPLUS_NODE_KIND_HPP

#include <bplus/defs.hpp>

#include <fmt/ostream.h>

#include <ostream>

namespace bplus {

/**
 * The role a page plays in the tree. Exactly one kind applies to a node at any time.
 *
 * Leaf family: `leaf`, `root_leaf` and `leaf_overflow` (continuation pages for runs of
 * entries that do not fit into a single leaf).
 * Internal family: `internal` and `root_internal`.
 * `lookup_overflow` pages are continuation pages of an internal-style lookup structure
 * and belong to neither family.
 */
enum class node_kind {
    leaf,
    internal,
    root_internal,
    root_leaf,
    leaf_overflow,
    lookup_overflow,
};

/// True for leaf, root leaf and leaf overflow pages.
constexpr bool is_leaf(node_kind kind) {
    switch (kind) {
    case node_kind::leaf:
    case node_kind::root_leaf:
    case node_kind::leaf_overflow:
        return true;
    case node_kind::internal:
    case node_kind::root_internal:
    case node_kind::lookup_overflow:
        return false;
    }
    return false;
}

/// True for internal and root internal pages.
constexpr bool is_internal(node_kind kind) {
    switch (kind) {
    case node_kind::internal:
    case node_kind::root_internal:
        return true;
    case node_kind::leaf:
    case node_kind::root_leaf:
    case node_kind::leaf_overflow:
    case node_kind::lookup_overflow:
        return false;
    }
    return false;
}

constexpr bool is_root(node_kind kind) {
    return kind == node_kind::root_leaf || kind == node_kind::root_internal;
}

constexpr bool is_overflow(node_kind kind) {
    return kind == node_kind::leaf_overflow;
}

constexpr bool is_lookup_overflow(node_kind kind) {
    return kind == node_kind::lookup_overflow;
}

/// Returns true if a node of kind `from` may be retagged as `to`.
/// Only root promotion and demotion within the same family are legal
/// (leaf <-> root leaf, internal <-> root internal).
constexpr bool can_transition(node_kind from, node_kind to) {
    if (from == to)
        return true;

    switch (from) {
    case node_kind::leaf:
        return to == node_kind::root_leaf;
    case node_kind::root_leaf:
        return to == node_kind::leaf;
    case node_kind::internal:
        return to == node_kind::root_internal;
    case node_kind::root_internal:
        return to == node_kind::internal;
    case node_kind::leaf_overflow:
    case node_kind::lookup_overflow:
        return false;
    }
    return false;
}

/// Returns the tag that identifies pages of the given kind on disk.
/// The mapping is part of the file format and must never change.
u16 page_type(node_kind kind);

/// Maps a persisted page tag back to its node kind.
///
/// \throws bad_page_type If `type` does not name a node kind. The page
///         must be considered corrupt.
node_kind kind_from_page_type(u16 type);

/// Returns the name of the given kind, e.g. "root_leaf".
const char* to_string(node_kind kind);

std::ostream& operator<<(std::ostream& os, node_kind kind);

} // namespace bplus

#if FMT_VERSION >= 90000
template<>
struct fmt::formatter<bplus::node_kind> : fmt::ostream_formatter {};
#endif

#endif // BPLUS_NODE_KIND_HPP
