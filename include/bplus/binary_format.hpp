#ifndef BPLUS_BINARY_FORMAT_HPP
#define BPLUS_BINARY_FORMAT_HPP

#include <bplus/defs.hpp>
#include <bplus/type_traits.hpp>

#include <tuple>
#include <utility>

namespace bplus {

/**
 * Describes the binary format of a fixed-size on-disk structure, such
 * as a page header. The binary format stores a series of member data pointers;
 * the members are serialized in exactly that order, without padding.
 *
 *  \code{.cpp}
 *      struct page_header {
 *          u16 type = 0;
 *          u32 capacity = 0;
 *
 *          static constexpr auto get_binary_format() {
 *              return binary_format(&page_header::type, &page_header::capacity);
 *          }
 *      };
 * \endcode
 *
 * The serialized header is 6 bytes long, `capacity` always starts at offset 2.
 * Changing the format of a structure breaks every file written with the old format.
 */
template<typename T, typename... V>
class binary_format {
public:
    constexpr binary_format(V T::*... fields)
        : m_fields(fields...) {}

    /// Returns the description of the classes fields,
    /// as a tuple of member data pointers.
    constexpr const std::tuple<V T::*...>& fields() const { return m_fields; }

private:
    std::tuple<V T::*...> m_fields;
};

template<typename T, typename... V>
binary_format(V T::*... members)->binary_format<T, V...>;

namespace detail {

template<typename T>
auto test_binary_format(T*) -> decltype((void) T::get_binary_format(), std::true_type());

std::false_type test_binary_format(...);

} // namespace detail

/// Returns true iff the type implements the static `get_binary_format()` function.
///
/// \relates binary_format
template<typename T>
constexpr bool has_binary_format() {
    using type = remove_cvref_t<T>;
    return decltype(detail::test_binary_format(static_cast<type*>(nullptr)))::value;
}

/// Returns the binary format that describes the type T.
///
/// \relates binary_format
template<typename T>
constexpr auto get_binary_format() {
    using type = remove_cvref_t<T>;
    static_assert(has_binary_format<type>(),
                  "The type does not implement the get_binary_format() function.");
    return type::get_binary_format();
}

} // namespace bplus

#endif // BPLUS_BINARY_FORMAT_HPP
