#include <bplus/configuration.hpp>

#include <bplus/exception.hpp>
#include <bplus/node_kind.hpp>
#include <bplus/page.hpp>

#include <fmt/ostream.h>

#include <utility>

namespace bplus {

namespace {

u32 degree_or_throw(node_kind kind, u32 page_size, u32 key_size) {
    u32 d = page_degree(kind, page_size, key_size);
    if (d < 2) {
        BPLUS_THROW(bad_argument(
            fmt::format("Page size {} is too small for {} pages with keys of {} bytes.", page_size,
                        kind, key_size)));
    }
    return d;
}

} // namespace

configuration::configuration(u32 page_size, bplus::schema s)
    : m_page_size(page_size)
    , m_schema(std::move(s)) {
    const u32 k = m_schema.key_size();
    const u32 leaf = degree_or_throw(node_kind::leaf, page_size, k);
    const u32 internal = degree_or_throw(node_kind::internal, page_size, k);
    const u32 overflow = degree_or_throw(node_kind::leaf_overflow, page_size, k);
    const u32 lookup = degree_or_throw(node_kind::lookup_overflow, page_size, k);

    m_limits.min_leaf = leaf - 1;
    m_limits.max_leaf = 2 * leaf - 1;
    m_limits.min_internal = internal - 1;
    m_limits.max_internal = 2 * internal - 1;
    m_limits.max_overflow = 2 * overflow - 1;
    m_limits.max_lookup_overflow = 2 * lookup - 1;
}

configuration::configuration(u32 page_size, bplus::schema s, const capacity_limits& limits)
    : m_page_size(page_size)
    , m_schema(std::move(s))
    , m_limits(limits) {
    check_limits();
}

void configuration::check_limits() const {
    auto check_max = [&](node_kind kind, u32 max) {
        if (max == 0) {
            BPLUS_THROW(
                bad_argument(fmt::format("The maximum capacity of {} pages must not be zero.", kind)));
        }

        const u64 required = required_page_size(kind, key_size(), max);
        if (required > m_page_size) {
            BPLUS_THROW(bad_argument(
                fmt::format("{} pages with {} keys need {} bytes, but the page size is {}.", kind,
                            max, required, m_page_size)));
        }
    };

    auto check_min = [&](node_kind kind, u32 min, u32 max) {
        if (min > max) {
            BPLUS_THROW(bad_argument(fmt::format(
                "The minimum capacity of {} pages ({}) exceeds the maximum ({}).", kind, min, max)));
        }
    };

    check_max(node_kind::leaf, m_limits.max_leaf);
    check_max(node_kind::internal, m_limits.max_internal);
    check_max(node_kind::leaf_overflow, m_limits.max_overflow);
    check_max(node_kind::lookup_overflow, m_limits.max_lookup_overflow);
    check_min(node_kind::leaf, m_limits.min_leaf, m_limits.max_leaf);
    check_min(node_kind::internal, m_limits.min_internal, m_limits.max_internal);
}

void configuration::dump(std::ostream& os) const {
    fmt::print(os,
               "Configuration:\n"
               "  Page size: {}\n"
               "  Schema: {}\n"
               "  Key size: {}\n"
               "  Leaf capacity: {} - {}\n"
               "  Internal capacity: {} - {}\n"
               "  Overflow capacity: {}\n"
               "  Lookup overflow capacity: {}\n",
               m_page_size, m_schema, key_size(), m_limits.min_leaf, m_limits.max_leaf,
               m_limits.min_internal, m_limits.max_internal, m_limits.max_overflow,
               m_limits.max_lookup_overflow);
}

} // namespace bplus
