#ifndef BPLUS_EXCEPTION_HPP
#define BPLUS_EXCEPTION_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>

/// @defgroup exception_support Exception support macros
/// @{

/**
 * Expands to the current source location (file, line, function).
 */
#define BPLUS_SOURCE_LOCATION (::bplus::source_location(__FILE__, __LINE__, __func__))

/**
 * Augments an @ref bplus::exception with the current source location.
 */
#define BPLUS_AUGMENT_EXCEPTION(e) (::bplus::detail::with_location((e), BPLUS_SOURCE_LOCATION))

/**
 * Throw the given @ref bplus::exception with added source location information.
 */
#define BPLUS_THROW(e) throw(BPLUS_AUGMENT_EXCEPTION(e))

/// @}

namespace bplus {

/**
 * Represents the source code location at which an exception was thrown.
 */
class source_location {
public:
    source_location() = default;

    source_location(const char* file, int line, const char* function)
        : m_file(file)
        , m_line(line)
        , m_function(function) {}

    const char* file() const { return m_file; }
    int line() const { return m_line; }
    const char* function() const { return m_function; }

private:
    const char* m_file = "";
    int m_line = 0;
    const char* m_function = "";
};

class exception;

namespace detail {

template<typename Exception>
Exception with_location(Exception&& e, const source_location& where) {
    static_assert(std::is_base_of<exception, std::decay_t<Exception>>::value,
                  "Exception must be derived from bplus::exception.");
    e.set_where(where);
    return std::forward<Exception>(e);
}

} // namespace detail

/**
 * Base class for all exceptions thrown by this library.
 */
class exception : public std::runtime_error {
public:
    using runtime_error::runtime_error;

    /**
     * Returns the source code location that threw this exception.
     *
     * \note Requires that the exception was thrown using
     * @ref BPLUS_THROW, otherwise `where()` will return an empty source location.
     */
    const source_location& where() const { return m_where; }

private:
    template<typename T>
    friend T detail::with_location(T&&, const source_location&);

    void set_where(const source_location& loc) { m_where = loc; }

private:
    source_location m_where;
};

/**
 * Thrown when the content of a page or an encoded key is known to be corrupted.
 */
class corruption_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when a page carries a type tag that does not name any node kind.
 */
class bad_page_type : public corruption_error {
public:
    using corruption_error::corruption_error;
};

/**
 * Thrown when a node would enter a state that violates the capacity rules of its kind.
 * This always indicates a bug in the calling tree algorithm; the node is left untouched.
 */
class invalid_tree_state : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when data could not be read or written to secondary storage.
 */
class io_error : public exception {
public:
    using exception::exception;
};

/**
 * Exceptions of this class or its subclasses are thrown when an object
 * is being misused, i.e. it is being passed the wrong arguments
 * or it is in the wrong state.
 */
class usage_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when an object cannot perform an operation in its current state.
 */
class bad_operation : public usage_error {
public:
    using usage_error::usage_error;
};

/**
 * Thrown when a node is retagged to a kind of another family
 * (e.g. from leaf to internal).
 */
class bad_kind_transition : public bad_operation {
public:
    using bad_operation::bad_operation;
};

/**
 * Thrown when an invalid argument is being passed to some operation.
 */
class bad_argument : public usage_error {
public:
    using usage_error::usage_error;
};

} // namespace bplus

#endif // BPLUS_EXCEPTION_HPP
