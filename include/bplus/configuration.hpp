#ifndef BPLUS_CONFIGURATION_HPP
#define BPLUS_CONFIGURATION_HPP

#include <bplus/defs.hpp>
#include <bplus/schema.hpp>

#include <ostream>

namespace bplus {

/// Capacity thresholds (number of keys) for every kind of page.
/// Root pages use the maximum of their non-root counterpart and have no minimum.
/// Overflow pages have no minimum.
struct capacity_limits {
    u32 min_leaf = 0;
    u32 max_leaf = 0;
    u32 min_internal = 0;
    u32 max_internal = 0;
    u32 max_overflow = 0;
    u32 max_lookup_overflow = 0;
};

/**
 * Tree-wide settings shared by every node: the page size, the key schema
 * and the capacity thresholds of each page kind.
 *
 * Configurations are immutable. Nodes keep a reference to their configuration,
 * which must therefore outlive them.
 */
class configuration {
public:
    /// Derives the capacity thresholds from the page size and the key size.
    /// For a page kind with degree `d`, the maximum is `2d - 1` keys and
    /// the minimum is `d - 1` keys.
    ///
    /// \throws bad_argument If the page is too small to hold at least 3 keys
    ///         of every page kind.
    configuration(u32 page_size, bplus::schema s);

    /// Uses explicit capacity thresholds.
    ///
    /// \throws bad_argument If a minimum exceeds its maximum, if a maximum is zero
    ///         or if a page with the maximum number of keys does not fit into a page.
    configuration(u32 page_size, bplus::schema s, const capacity_limits& limits);

    u32 page_size() const { return m_page_size; }

    const bplus::schema& schema() const { return m_schema; }

    /// Size of an encoded key, in bytes.
    u32 key_size() const { return m_schema.key_size(); }

    const capacity_limits& limits() const { return m_limits; }

    u32 min_leaf_capacity() const { return m_limits.min_leaf; }
    u32 max_leaf_capacity() const { return m_limits.max_leaf; }
    u32 min_internal_capacity() const { return m_limits.min_internal; }
    u32 max_internal_capacity() const { return m_limits.max_internal; }
    u32 max_overflow_capacity() const { return m_limits.max_overflow; }
    u32 max_lookup_overflow_capacity() const { return m_limits.max_lookup_overflow; }

    /// Prints the configuration in a human readable form.
    void dump(std::ostream& os) const;

private:
    void check_limits() const;

private:
    u32 m_page_size = 0;
    bplus::schema m_schema;
    capacity_limits m_limits;
};

} // namespace bplus

#endif // BPLUS_CONFIGURATION_HPP
