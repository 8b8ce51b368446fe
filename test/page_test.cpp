#include <catch.hpp>

#include <bplus/exception.hpp>
#include <bplus/nodes.hpp>
#include <bplus/page.hpp>

#include "./test_config.hpp"

#include <array>
#include <sstream>
#include <vector>

using namespace bplus;

namespace {

void write_raw(file& f, u64 index, u32 page_size, u16 type, u32 capacity) {
    std::vector<byte> data(page_size, 0);
    serialize(page_header{type, capacity}, data.data());
    f.write(page_offset(index, page_size), data.data(), page_size);
}

template<typename Node>
Node& as(const std::unique_ptr<node>& n) {
    REQUIRE(n.get() != nullptr);
    Node* result = dynamic_cast<Node*>(n.get());
    REQUIRE(result != nullptr);
    return *result;
}

} // namespace

TEST_CASE("page layout sizes", "[page]") {
    REQUIRE(serialized_size<page_header>() == 6);
    REQUIRE(page_offset(3, 4096) == 12288);

    REQUIRE(required_page_size(node_kind::leaf, 10, 0) == 22);
    REQUIRE(required_page_size(node_kind::root_leaf, 10, 4) == 62);
    REQUIRE(required_page_size(node_kind::leaf_overflow, 10, 2) == 42);
    REQUIRE(required_page_size(node_kind::internal, 10, 2) == 14 + 2 * 18);
    REQUIRE(required_page_size(node_kind::root_internal, 10, 1) == 32);
    REQUIRE(required_page_size(node_kind::lookup_overflow, 10, 3) == 44);

    REQUIRE(page_degree(node_kind::leaf, 4096, 4) == 509);
    REQUIRE(page_degree(node_kind::internal, 4096, 4) == 170);
    REQUIRE(page_degree(node_kind::lookup_overflow, 4096, 4) == 510);
    REQUIRE(page_degree(node_kind::leaf, 22, 4) == 0);
    REQUIRE(page_degree(node_kind::leaf, 16, 4) == 0);
}

TEST_CASE("the page header starts every page", "[page]") {
    const configuration config = test_config();
    auto f = memory_file();

    leaf_node leaf(node_kind::root_leaf, 1, config);
    leaf.push_back(test_key(config, 42));
    leaf.write(*f);

    REQUIRE(f->file_size() == 2 * config.page_size());

    std::array<byte, 26> data;
    f->read(config.page_size(), data.data(), data.size());

    std::array<byte, 26> expected{
        0, 4,                   // type
        0, 0, 0, 1,             // capacity
        0, 0, 0, 0, 0, 0, 0, 0, // next
        0, 0, 0, 0, 0, 0, 0, 0, // prev
        0, 0, 0, 42,            // first column of the key
    };
    REQUIRE(data == expected);
}

TEST_CASE("leaf pages", "[page]") {
    const configuration config = test_config();
    auto f = memory_file();

    leaf_node leaf(node_kind::leaf, 2, config);
    leaf.set_next(5);
    leaf.set_prev(3);
    leaf.push_back(test_key(config, 1, "a"));
    leaf.push_back(test_key(config, 2, "bc"));
    leaf.push_back(test_key(config, 3, ""));
    leaf.settle();
    leaf.write(*f);

    auto n = read_node(*f, 2, config);
    auto& result = as<leaf_node>(n);
    REQUIRE(result.kind() == node_kind::leaf);
    REQUIRE(result.index() == 2);
    REQUIRE(result.next() == 5);
    REQUIRE(result.prev() == 3);
    REQUIRE(result.capacity() == 3);
    REQUIRE(result.keys() == leaf.keys());
    REQUIRE(result.being_deleted());
    REQUIRE_NOTHROW(result.settle());
}

TEST_CASE("internal pages", "[page]") {
    const configuration config = test_config();
    auto f = memory_file();

    SECTION("keys and children") {
        internal_node in(node_kind::root_internal, 1, config);
        in.push_back(test_key(config, 10));
        in.push_back(test_key(config, 20));
        in.insert_child(0, 7);
        in.insert_child(1, 8);
        in.insert_child(2, 9);
        in.write(*f);

        auto n = read_node(*f, 1, config);
        auto& result = as<internal_node>(n);
        REQUIRE(result.kind() == node_kind::root_internal);
        REQUIRE(result.keys() == in.keys());
        REQUIRE(result.children() == in.children());
    }

    SECTION("a root without keys keeps its only child") {
        internal_node in(node_kind::root_internal, 1, config);
        in.insert_child(0, 12);
        in.write(*f);

        auto n = read_node(*f, 1, config);
        auto& result = as<internal_node>(n);
        REQUIRE(result.is_empty());
        REQUIRE(result.child_count() == 1);
        REQUIRE(result.child(0) == 12);
    }

    SECTION("a root without keys and children") {
        internal_node in(node_kind::root_internal, 1, config);
        in.write(*f);

        auto n = read_node(*f, 1, config);
        REQUIRE(as<internal_node>(n).child_count() == 0);
    }

    SECTION("the number of children must match the number of keys") {
        internal_node in(node_kind::internal, 1, config);
        in.push_back(test_key(config, 10));
        in.insert_child(0, 7);
        REQUIRE_THROWS_AS(in.write(*f), invalid_tree_state);

        in.insert_child(1, 8);
        in.insert_child(2, 9);
        REQUIRE_THROWS_AS(in.write(*f), invalid_tree_state);

        in.remove_child(2);
        REQUIRE_NOTHROW(in.write(*f));
    }
}

TEST_CASE("overflow pages", "[page]") {
    const configuration config = test_config();
    auto f = memory_file();

    overflow_node o(4, config);
    o.set_next(6);
    o.set_prev(2);
    o.push_back(test_key(config, 5));
    o.push_back(test_key(config, 5));
    o.write(*f);

    lookup_overflow_node l(5, config);
    l.set_next(9);
    for (i32 i = 0; i < 6; ++i)
        l.push_back(test_key(config, i, "zz"));
    l.write(*f);

    auto n1 = read_node(*f, 4, config);
    auto& o2 = as<overflow_node>(n1);
    REQUIRE(o2.next() == 6);
    REQUIRE(o2.prev() == 2);
    REQUIRE(o2.keys() == o.keys());

    auto n2 = read_node(*f, 5, config);
    auto& l2 = as<lookup_overflow_node>(n2);
    REQUIRE(l2.kind() == node_kind::lookup_overflow);
    REQUIRE(l2.next() == 9);
    REQUIRE(l2.is_full());
    REQUIRE(l2.keys() == l.keys());
}

TEST_CASE("invalid pages", "[page]") {
    const configuration config = test_config();
    auto f = memory_file();

    write_raw(*f, 1, config.page_size(), 0, 0);
    REQUIRE_THROWS_AS(read_node(*f, 1, config), bad_page_type);

    write_raw(*f, 1, config.page_size(), 7, 0);
    REQUIRE_THROWS_AS(read_node(*f, 1, config), bad_page_type);

    // Leaf pages hold at most 4 keys in this configuration.
    write_raw(*f, 1, config.page_size(), 1, 5);
    REQUIRE_THROWS_AS(read_node(*f, 1, config), corruption_error);

    write_raw(*f, 1, config.page_size(), 1, 4);
    REQUIRE_NOTHROW(read_node(*f, 1, config));

    // Page 3 does not exist yet.
    REQUIRE_THROWS_AS(read_node(*f, 3, config), io_error);
}

TEST_CASE("nodes can be printed", "[page]") {
    const configuration config = test_config();

    leaf_node leaf(node_kind::root_leaf, 1, config);
    leaf.set_next(2);
    leaf.push_back(test_key(config, 42));

    std::stringstream leaf_out;
    leaf.print(leaf_out);
    REQUIRE(leaf_out.str()
            == "Leaf node @1 (root_leaf):\n"
               "  Next: @2\n"
               "  Prev: @0\n"
               "  Keys: 1\n"
               "    0: [42 abc]\n");

    internal_node in(node_kind::internal, 3, config);
    in.push_back(test_key(config, 5, "x"));
    in.insert_child(0, 4);
    in.insert_child(1, 6);

    std::stringstream internal_out;
    in.print(internal_out);
    REQUIRE(internal_out.str()
            == "Internal node @3 (internal):\n"
               "  Children: 2\n"
               "    0: @4 (<= [5 x])\n"
               "    1: @6\n"
               "  Keys: 1\n"
               "    0: [5 x]\n");
}
