#ifndef BPLUS_ASSERT_HPP
#define BPLUS_ASSERT_HPP

/// \defgroup assertions Assertion Macros
/// @{

#ifndef NDEBUG

/// BPLUS_DEBUG is defined when this library is used in debug mode.
#    define BPLUS_DEBUG

#endif

#ifdef BPLUS_DEBUG

/// When in debug mode, check against the given condition
/// and abort the program with a message if the check fails.
/// Does nothing in release mode.
#    define BPLUS_ASSERT(cond, message)                                             \
        do {                                                                        \
            if (!(cond)) {                                                          \
                ::bplus::detail::assert_impl(__FILE__, __LINE__, #cond, (message)); \
            }                                                                       \
        } while (0)

#else

#    define BPLUS_ASSERT(cond, message)

#endif

/// Unconditionally terminate the program when unreachable code is executed.
#define BPLUS_UNREACHABLE(message) \
    (::bplus::detail::unreachable_impl(__FILE__, __LINE__, (message)))

/// @}

/// \cond INTERNAL
namespace bplus::detail {

[[noreturn]] void assert_impl(const char* file, int line, const char* cond, const char* message);
[[noreturn]] void unreachable_impl(const char* file, int line, const char* message);

} // namespace bplus::detail
/// \endcond

#endif // BPLUS_ASSERT_HPP
