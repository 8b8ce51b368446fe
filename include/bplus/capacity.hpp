#ifndef BPLUS_CAPACITY_HPP
#define BPLUS_CAPACITY_HPP

#include <bplus/configuration.hpp>
#include <bplus/defs.hpp>
#include <bplus/node_kind.hpp>

namespace bplus {

/// \defgroup capacity Capacity rules
///
/// The number of keys a node may hold depends on its kind:
///
/// | kind            | minimum (stable)  | maximum             |
/// |-----------------|-------------------|---------------------|
/// | root_leaf       | 0                 | max_leaf            |
/// | root_internal   | 0                 | max_internal        |
/// | leaf            | min_leaf          | max_leaf            |
/// | internal        | min_internal      | max_internal        |
/// | leaf_overflow   | 0                 | max_overflow        |
/// | lookup_overflow | 0                 | max_lookup_overflow |
///
/// While a node is being deleted from, the minimum is relaxed to 0.
/// @{

/// The smallest number of keys a stable node of the given kind may hold.
u32 min_capacity(node_kind kind, const configuration& config);

/// The largest number of keys a node of the given kind may hold.
u32 max_capacity(node_kind kind, const configuration& config);

/// Checks that a node of the given kind may hold `capacity` keys.
/// Has no side effects.
///
/// \throws invalid_tree_state If the capacity is out of bounds.
void validate_capacity(node_kind kind, i64 capacity, bool being_deleted,
                       const configuration& config);

/// True iff a node of the given kind holds the maximum number of keys.
/// Inserting into a full node requires a split first.
bool is_full(node_kind kind, u32 capacity, const configuration& config);

/// True iff a node of the given kind has become small enough to be merged
/// with (or to borrow from) a sibling. Roots must collapse once they hold
/// at most one key, overflow pages once they are empty.
bool is_time_to_merge(node_kind kind, u32 capacity, const configuration& config);

/// @}

} // namespace bplus

#endif // BPLUS_CAPACITY_HPP
