#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace detail {

// Offset/hex/ascii dump of a byte vector, `width` bytes per line.
// Bytes past `limit` are summarized as "(N bytes left)".
template <typename ByteType, typename FormatContext>
auto formatByteDump(const std::vector<ByteType> &data, FormatContext &ctx,
                    size_t width, char presentation, size_t limit) {
    auto out = ctx.out();
    if (data.empty()) {
        return std::format_to(out, "[empty]");
    }
    if (presentation != 'x' && presentation != 'X') {
        return std::format_to(out, "[{} bytes]", data.size());
    }

    const size_t shown = std::min(data.size(), limit);
    std::string ascii;
    ascii.reserve(width);

    for (size_t i = 0; i < shown; ++i) {
        const uint8_t byte = static_cast<uint8_t>(data[i]);
        if (i % width == 0) {
            if (i > 0) {
                out = std::format_to(out, " |{}|\n", ascii);
                ascii.clear();
            }
            out = std::format_to(out, "{:04X}: ", i);
        }
        out = std::format_to(out, "{:02X} ", byte);
        ascii += std::isprint(byte) ? static_cast<char>(byte) : '.';
    }

    size_t pad = (width - shown % width) % width;
    out = std::fill_n(out, pad * 3, ' ');
    out = std::format_to(out, " |{}|", ascii);

    if (shown < data.size()) {
        out = std::format_to(out, "\n({} bytes left)", data.size() - shown);
    }
    return out;
}

// Format options: [width][x|X][L<limit>]
constexpr auto parseByteDumpOptions(std::format_parse_context &ctx, size_t &width,
                                 char &presentation, size_t &limit) {
    auto it = ctx.begin();
    auto end = ctx.end();

    auto readNumber = [&](size_t &value) {
        value = 0;
        while (it != end && *it >= '0' && *it <= '9') {
            value = value * 10 + static_cast<size_t>(*it - '0');
            ++it;
        }
    };

    if (it != end && *it >= '0' && *it <= '9') {
        size_t w = 0;
        readNumber(w);
        if (w > 0) {
            width = w;
        }
    }
    if (it != end && (*it == 'x' || *it == 'X')) {
        presentation = *it++;
    }
    if (it != end && (*it == 'L' || *it == 'l')) {
        ++it;
        if (it == end || *it < '0' || *it > '9') {
            throw std::format_error("byte dump limit needs digits after 'L'");
        }
        readNumber(limit);
    }
    if (it != end && *it != '}') {
        throw std::format_error("invalid byte dump format options");
    }
    return it;
}

} // namespace detail

namespace std {

struct byte_vector_formatter_base {
    char presentation = 'x';
    size_t width = 16;
    size_t limit = SIZE_MAX;

    constexpr auto parse(format_parse_context &ctx) {
        return detail::parseByteDumpOptions(ctx, width, presentation, limit);
    }
};

template <> struct formatter<std::vector<uint8_t>> : byte_vector_formatter_base {
    template <typename FormatContext>
    auto format(const std::vector<uint8_t> &data, FormatContext &ctx) const {
        return detail::formatByteDump(data, ctx, width, presentation, limit);
    }
};

template <> struct formatter<std::vector<char>> : byte_vector_formatter_base {
    template <typename FormatContext>
    auto format(const std::vector<char> &data, FormatContext &ctx) const {
        return detail::formatByteDump(data, ctx, width, presentation, limit);
    }
};

} // namespace std
