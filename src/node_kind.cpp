#include <bplus/node_kind.hpp>

#include <bplus/assert.hpp>
#include <bplus/exception.hpp>

#include <fmt/format.h>

namespace bplus {

u16 page_type(node_kind kind) {
    switch (kind) {
    case node_kind::leaf:
        return 1;
    case node_kind::internal:
        return 2;
    case node_kind::root_internal:
        return 3;
    case node_kind::root_leaf:
        return 4;
    case node_kind::leaf_overflow:
        return 5;
    case node_kind::lookup_overflow:
        return 6;
    }
    BPLUS_UNREACHABLE("invalid node kind");
}

node_kind kind_from_page_type(u16 type) {
    switch (type) {
    case 1:
        return node_kind::leaf;
    case 2:
        return node_kind::internal;
    case 3:
        return node_kind::root_internal;
    case 4:
        return node_kind::root_leaf;
    case 5:
        return node_kind::leaf_overflow;
    case 6:
        return node_kind::lookup_overflow;
    default:
        break;
    }
    BPLUS_THROW(bad_page_type(
        fmt::format("Unknown page type {} read from disk, the file is possibly corrupt.", type)));
}

const char* to_string(node_kind kind) {
    switch (kind) {
    case node_kind::leaf:
        return "leaf";
    case node_kind::internal:
        return "internal";
    case node_kind::root_internal:
        return "root_internal";
    case node_kind::root_leaf:
        return "root_leaf";
    case node_kind::leaf_overflow:
        return "leaf_overflow";
    case node_kind::lookup_overflow:
        return "lookup_overflow";
    }
    BPLUS_UNREACHABLE("invalid node kind");
}

std::ostream& operator<<(std::ostream& os, node_kind kind) {
    return os << to_string(kind);
}

} // namespace bplus
