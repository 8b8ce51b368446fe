#ifndef BPLUS_FILE_HPP
#define BPLUS_FILE_HPP

#include <bplus/defs.hpp>

#include <memory>

namespace bplus {

/**
 * A random access file that pages are read from and written to.
 * Nodes never open or close files themselves, they always operate
 * on a file handle owned by the caller.
 */
class file {
public:
    file() = default;
    virtual ~file();

    /// Reads exactly `count` bytes at the given offset into the provided buffer.
    ///
    /// \throws io_error If the range is not part of the file.
    virtual void read(u64 offset, void* buffer, u32 count) = 0;

    /// Writes exactly `count` bytes at the given offset.
    /// Writing beyond the end of the file makes the file grow,
    /// the gap is filled with zero bytes.
    virtual void write(u64 offset, const void* buffer, u32 count) = 0;

    /// Returns the size of the file, in bytes.
    virtual u64 file_size() const = 0;

    file(const file&) = delete;
    file& operator=(const file&) = delete;
};

/// Creates a new, empty file that lives in memory.
std::unique_ptr<file> memory_file();

} // namespace bplus

#endif // BPLUS_FILE_HPP
