#ifndef BPLUS_TYPE_TRAITS_HPP
#define BPLUS_TYPE_TRAITS_HPP

#include <bplus/defs.hpp>

#include <type_traits>

namespace bplus {

template<typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

namespace detail {

template<typename Ptr>
struct member_ptr_traits;

template<typename Object, typename Member>
struct member_ptr_traits<Member Object::*> {
    using member_type = Member;
};

} // namespace detail

/**
 * Returns the member type when given the type of a member data pointer.
 *
 * Example:
 *  struct ex {
 *      int x;
 *  };
 *
 *  member_type_t<decltype(&ex::x)> is int.
 */
template<typename MemberPtr>
using member_type_t = typename detail::member_ptr_traits<MemberPtr>::member_type;

} // namespace bplus

#endif // BPLUS_TYPE_TRAITS_HPP
