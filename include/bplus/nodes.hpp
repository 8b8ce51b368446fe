#ifndef BPLUS_NODES_HPP
#define BPLUS_NODES_HPP

#include <bplus/configuration.hpp>
#include <bplus/defs.hpp>
#include <bplus/file.hpp>
#include <bplus/internal_node.hpp>
#include <bplus/leaf_node.hpp>
#include <bplus/node.hpp>
#include <bplus/overflow_node.hpp>

#include <memory>

namespace bplus {

/// Reads the page with the given index and constructs the node stored in it.
/// The concrete type of the returned node depends on the page's type tag.
/// Like a freshly constructed node, the returned node is in its initial deletion phase
/// (see `node::settle()`).
///
/// \throws bad_page_type If the page's type tag does not name a node kind.
/// \throws corruption_error If the page content is inconsistent, e.g. if it claims to hold
///         more keys than its kind allows.
/// \throws io_error If the page could not be read.
std::unique_ptr<node> read_node(file& f, u64 index, const configuration& config);

} // namespace bplus

#endif // BPLUS_NODES_HPP
