#include <bplus/capacity.hpp>

#include <bplus/assert.hpp>
#include <bplus/exception.hpp>

#include <fmt/format.h>

namespace bplus {

u32 min_capacity(node_kind kind, const configuration& config) {
    switch (kind) {
    case node_kind::leaf:
        return config.min_leaf_capacity();
    case node_kind::internal:
        return config.min_internal_capacity();
    case node_kind::root_leaf:
    case node_kind::root_internal:
    case node_kind::leaf_overflow:
    case node_kind::lookup_overflow:
        return 0;
    }
    BPLUS_UNREACHABLE("invalid node kind");
}

u32 max_capacity(node_kind kind, const configuration& config) {
    switch (kind) {
    case node_kind::leaf:
    case node_kind::root_leaf:
        return config.max_leaf_capacity();
    case node_kind::internal:
    case node_kind::root_internal:
        return config.max_internal_capacity();
    case node_kind::leaf_overflow:
        return config.max_overflow_capacity();
    case node_kind::lookup_overflow:
        return config.max_lookup_overflow_capacity();
    }
    BPLUS_UNREACHABLE("invalid node kind");
}

void validate_capacity(node_kind kind, i64 capacity, bool being_deleted,
                       const configuration& config) {
    if (capacity < 0) {
        BPLUS_THROW(invalid_tree_state(
            fmt::format("Cannot have less than 0 elements in a {} node.", kind)));
    }

    const i64 min = being_deleted ? 0 : min_capacity(kind, config);
    if (capacity < min) {
        BPLUS_THROW(invalid_tree_state(fmt::format(
            "Cannot have less than {} elements in a {} node (has {}).", min, kind, capacity)));
    }

    const i64 max = max_capacity(kind, config);
    if (capacity > max) {
        BPLUS_THROW(invalid_tree_state(fmt::format(
            "Exceeded {} node allowed capacity of {} elements (has {}).", kind, max, capacity)));
    }
}

bool is_full(node_kind kind, u32 capacity, const configuration& config) {
    return capacity == max_capacity(kind, config);
}

bool is_time_to_merge(node_kind kind, u32 capacity, const configuration& config) {
    if (is_root(kind))
        return capacity <= 1;
    if (is_overflow(kind) || is_lookup_overflow(kind))
        return capacity == 0;
    return capacity <= min_capacity(kind, config);
}

} // namespace bplus
