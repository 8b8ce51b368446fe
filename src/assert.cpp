#include <bplus/assert.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace bplus::detail {

void assert_impl(const char* file, int line, const char* condition, const char* message) {
    if (message && *message) {
        fmt::print(stderr, "Assertion `{}` failed: {}\n", condition, message);
    } else {
        fmt::print(stderr, "Assertion `{}` failed\n", condition);
    }
    fmt::print(stderr, "    (in {}:{})\n", file, line);
    std::abort();
}

void unreachable_impl(const char* file, int line, const char* message) {
    if (message && *message) {
        fmt::print(stderr, "Unreachable code executed: {}.\n", message);
    } else {
        fmt::print(stderr, "Unreachable code executed.\n");
    }
    fmt::print(stderr, "    (in {}:{})\n", file, line);
    std::abort();
}

} // namespace bplus::detail
