// payload_encoder.cc
#include "payload_encoder.h"
#include <charconv>
#include <cstring>

namespace plotpipe {

void append_text_tuple(std::string& out, const Tuple& tuple) {
    const std::size_t points = tuple.empty() ? 0 : tuple.front().size();
    char buf[64];

    for (std::size_t p = 0; p < points; ++p) {
        for (std::size_t c = 0; c < tuple.size(); ++c) {
            if (c != 0) out += ' ';
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), tuple[c][p]);
            out.append(buf, ec == std::errc() ? end : buf);
        }
        out += '\n';
    }
    out += END_OF_DATA;
    out += '\n';
}

void append_binary_tuple(std::string& out, const Tuple& tuple) {
    const std::size_t points = tuple.empty() ? 0 : tuple.front().size();
    const std::size_t start = out.size();
    out.resize(start + points * tuple.size() * sizeof(double));

    char* dst = &out[start];
    for (std::size_t p = 0; p < points; ++p) {
        for (const auto& column : tuple) {
            std::memcpy(dst, &column[p], sizeof(double));
            dst += sizeof(double);
        }
    }
}

std::string encode_chunk(const Chunk& chunk, bool binary) {
    std::string out;
    for (const auto& tuple : chunk.curves) {
        if (binary) {
            append_binary_tuple(out, tuple);
        } else {
            append_text_tuple(out, tuple);
        }
    }
    return out;
}

}  // namespace plotpipe
