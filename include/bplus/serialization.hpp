#ifndef BPLUS_SERIALIZATION_HPP
#define BPLUS_SERIALIZATION_HPP

#include <bplus/binary_format.hpp>
#include <bplus/defs.hpp>
#include <bplus/detail/iter_tools.hpp>
#include <bplus/type_traits.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <limits>
#include <type_traits>

namespace bplus {

/// \defgroup serialization Binary Serialization
///
/// Every field of a page is stored in big endian byte order, without padding.
/// Supported types are 16, 32 and 64 bit integers, `float` and `double`
/// (as their IEEE 754 bit pattern) and structures that describe their members
/// with a static `get_binary_format()` function (see \ref binary_format).

template<typename T>
constexpr size_t serialized_size();

template<typename T>
void serialize(const T& v, byte* buffer);

template<typename T>
T deserialize(const byte* buffer);

namespace detail {

template<typename T>
constexpr bool is_wire_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool>
                                   && (sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

template<typename T>
constexpr bool is_wire_float_v = std::is_same_v<T, float> || std::is_same_v<T, double>;

// The unsigned integer that carries the bits of a floating point value.
template<typename T>
using float_bits_t = std::conditional_t<std::is_same_v<T, float>, u32, u64>;

template<typename T>
constexpr size_t struct_size() {
    size_t size = 0;
    tuple_for_each(get_binary_format<T>().fields(), [&](auto field) {
        size += serialized_size<member_type_t<decltype(field)>>();
    });
    return size;
}

} // namespace detail

/// Returns the exact number of bytes occupied by a serialized `T`.
///
/// \ingroup serialization
template<typename T>
constexpr size_t serialized_size() {
    using type = remove_cvref_t<T>;
    if constexpr (detail::is_wire_integer_v<type> || detail::is_wire_float_v<type>) {
        return sizeof(type);
    } else {
        static_assert(has_binary_format<type>(),
                      "The type cannot be serialized. It must be a fixed size numeric type or "
                      "implement get_binary_format().");
        return detail::struct_size<type>();
    }
}

/// Serializes `v` into `buffer`, which must provide room for
/// `serialized_size<T>()` bytes.
///
/// \ingroup serialization
template<typename T>
void serialize(const T& v, byte* buffer) {
    if constexpr (detail::is_wire_integer_v<T>) {
        const T big = boost::endian::native_to_big(v);
        std::memcpy(buffer, &big, sizeof(T));
    } else if constexpr (detail::is_wire_float_v<T>) {
        static_assert(std::numeric_limits<T>::is_iec559,
                      "The floating point type must conform to IEEE 754.");
        detail::float_bits_t<T> bits;
        std::memcpy(&bits, &v, sizeof(T));
        serialize(bits, buffer);
    } else {
        detail::tuple_for_each(get_binary_format<T>().fields(), [&](auto field) {
            serialize(v.*field, buffer);
            buffer += serialized_size<member_type_t<decltype(field)>>();
        });
    }
}

/// Reads a `T` from `buffer`, which must hold at least
/// `serialized_size<T>()` bytes.
///
/// \ingroup serialization
template<typename T>
T deserialize(const byte* buffer) {
    if constexpr (detail::is_wire_integer_v<T>) {
        T big;
        std::memcpy(&big, buffer, sizeof(T));
        return boost::endian::big_to_native(big);
    } else if constexpr (detail::is_wire_float_v<T>) {
        const auto bits = deserialize<detail::float_bits_t<T>>(buffer);
        T v;
        std::memcpy(&v, &bits, sizeof(T));
        return v;
    } else {
        static_assert(std::is_default_constructible_v<T>, "The type must be default constructible.");
        T v;
        detail::tuple_for_each(get_binary_format<T>().fields(), [&](auto field) {
            using member = member_type_t<decltype(field)>;
            v.*field = deserialize<member>(buffer);
            buffer += serialized_size<member>();
        });
        return v;
    }
}

} // namespace bplus

#endif // BPLUS_SERIALIZATION_HPP
