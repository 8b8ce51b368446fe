#include <bplus/nodes.hpp>

#include <bplus/assert.hpp>
#include <bplus/capacity.hpp>
#include <bplus/exception.hpp>
#include <bplus/page.hpp>

#include <fmt/ostream.h>

namespace bplus {

namespace {

std::unique_ptr<node> make_node(node_kind kind, u64 index, const configuration& config) {
    switch (kind) {
    case node_kind::leaf:
    case node_kind::root_leaf:
        return std::make_unique<leaf_node>(kind, index, config);
    case node_kind::internal:
    case node_kind::root_internal:
        return std::make_unique<internal_node>(kind, index, config);
    case node_kind::leaf_overflow:
        return std::make_unique<overflow_node>(index, config);
    case node_kind::lookup_overflow:
        return std::make_unique<lookup_overflow_node>(index, config);
    }
    BPLUS_UNREACHABLE("invalid node kind");
}

} // namespace

std::unique_ptr<node> read_node(file& f, u64 index, const configuration& config) {
    detail::page_reader r(f, index, config.page_size());

    const page_header header = r.get<page_header>();
    const node_kind kind = kind_from_page_type(header.type);
    const u32 max = max_capacity(kind, config);
    if (header.capacity > max) {
        BPLUS_THROW(corruption_error(
            fmt::format("Page {} claims to hold {} keys, but {} pages hold at most {}.", index,
                        header.capacity, kind, max)));
    }

    std::unique_ptr<node> n = make_node(kind, index, config);
    n->read(r, header.capacity);
    return n;
}

} // namespace bplus
