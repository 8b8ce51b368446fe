#ifndef TEST_CONFIG_HPP
#define TEST_CONFIG_HPP

#include <bplus/configuration.hpp>
#include <bplus/key.hpp>
#include <bplus/schema.hpp>

namespace bplus {

// Small capacities so that the capacity rules are easy to hit.
inline capacity_limits test_limits() {
    capacity_limits limits;
    limits.min_leaf = 2;
    limits.max_leaf = 4;
    limits.min_internal = 2;
    limits.max_internal = 5;
    limits.max_overflow = 3;
    limits.max_lookup_overflow = 6;
    return limits;
}

inline configuration test_config(const capacity_limits& limits = test_limits()) {
    return configuration(512, schema{column::int32(), column::fixed_string(3)}, limits);
}

inline key test_key(const configuration& config, i32 n, std::string str = "abc") {
    return key(config.schema(), {n, std::move(str)});
}

} // namespace bplus

#endif // TEST_CONFIG_HPP
