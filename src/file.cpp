#include <bplus/file.hpp>

#include <bplus/assert.hpp>
#include <bplus/exception.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace bplus {

file::~file() {}

namespace {

class in_memory_file final : public file {
public:
    void read(u64 offset, void* buffer, u32 count) override {
        BPLUS_ASSERT(buffer != nullptr, "Buffer null pointer");

        if (offset > m_data.size() || count > m_data.size() - offset) {
            BPLUS_THROW(io_error(fmt::format(
                "Read of {} bytes at offset {} is out of bounds (file size is {}).", count, offset,
                m_data.size())));
        }

        auto begin = m_data.begin() + offset;
        std::copy(begin, begin + count, static_cast<byte*>(buffer));
    }

    void write(u64 offset, const void* buffer, u32 count) override {
        BPLUS_ASSERT(buffer != nullptr, "Buffer null pointer");

        if (offset + count > m_data.size())
            m_data.resize(offset + count);

        auto begin = static_cast<const byte*>(buffer);
        std::copy(begin, begin + count, m_data.begin() + offset);
    }

    u64 file_size() const override { return m_data.size(); }

private:
    std::vector<byte> m_data;
};

} // namespace

std::unique_ptr<file> memory_file() {
    return std::make_unique<in_memory_file>();
}

} // namespace bplus
