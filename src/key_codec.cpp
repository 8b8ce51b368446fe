#include <bplus/key_codec.hpp>

#include <bplus/assert.hpp>
#include <bplus/exception.hpp>
#include <bplus/serialization.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <utility>
#include <vector>

namespace bplus {

size_t encode_key(const schema& s, const key& k, byte* buffer, size_t buffer_size) {
    BPLUS_ASSERT(buffer != nullptr, "Buffer null pointer.");
    if (buffer_size < s.key_size()) {
        BPLUS_THROW(bad_argument(fmt::format(
            "Buffer of {} bytes is too small for a key of {} bytes.", buffer_size, s.key_size())));
    }
    check_key(s, k);

    byte* out = buffer;
    for (u32 i = 0; i < s.size(); ++i) {
        const column& col = s[i];
        const value& v = k[i];
        switch (col.type()) {
        case column_type::int32:
            serialize(std::get<i32>(v), out);
            break;
        case column_type::int64:
            serialize(std::get<i64>(v), out);
            break;
        case column_type::float32:
            serialize(std::get<float>(v), out);
            break;
        case column_type::float64:
            serialize(std::get<double>(v), out);
            break;
        case column_type::fixed_string: {
            const std::string& str = std::get<std::string>(v);
            std::memcpy(out, str.data(), str.size());
            std::memset(out + str.size(), 0, col.width() - str.size());
            break;
        }
        }
        out += col.width();
    }
    return s.key_size();
}

key decode_key(const schema& s, const byte* buffer, size_t buffer_size) {
    BPLUS_ASSERT(buffer != nullptr, "Buffer null pointer.");
    if (buffer_size < s.key_size()) {
        BPLUS_THROW(corruption_error(fmt::format(
            "Truncated key: expected {} bytes but only {} are available.", s.key_size(),
            buffer_size)));
    }

    std::vector<value> values;
    values.reserve(s.size());

    const byte* in = buffer;
    for (u32 i = 0; i < s.size(); ++i) {
        const column& col = s[i];
        switch (col.type()) {
        case column_type::int32:
            values.emplace_back(deserialize<i32>(in));
            break;
        case column_type::int64:
            values.emplace_back(deserialize<i64>(in));
            break;
        case column_type::float32:
            values.emplace_back(deserialize<float>(in));
            break;
        case column_type::float64:
            values.emplace_back(deserialize<double>(in));
            break;
        case column_type::fixed_string: {
            const byte* end = in + col.width();
            const byte* nul = std::find(in, end, 0);
            if (std::any_of(nul, end, [](byte b) { return b != 0; })) {
                BPLUS_THROW(corruption_error(
                    fmt::format("Fixed string in column {} has data after its terminator.", i)));
            }
            values.emplace_back(std::string(reinterpret_cast<const char*>(in), nul - in));
            break;
        }
        }
        in += col.width();
    }
    return key(s, std::move(values));
}

std::string format_key(const schema& s, const key& k) {
    check_key(s, k);

    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);
    buf.push_back('[');
    for (u32 i = 0; i < s.size(); ++i) {
        if (i > 0)
            buf.push_back(' ');

        const value& v = k[i];
        switch (s[i].type()) {
        case column_type::int32:
            fmt::format_to(out, "{}", std::get<i32>(v));
            break;
        case column_type::int64:
            fmt::format_to(out, "{}", std::get<i64>(v));
            break;
        case column_type::float32:
            fmt::format_to(out, "{}", std::get<float>(v));
            break;
        case column_type::float64:
            fmt::format_to(out, "{}", std::get<double>(v));
            break;
        case column_type::fixed_string:
            fmt::format_to(out, "{}", std::get<std::string>(v));
            break;
        }
    }
    buf.push_back(']');
    return fmt::to_string(buf);
}

} // namespace bplus
