#pragma once

#include <string>
#include "chunk.h"

namespace plotpipe {

// Terminates a text-mode inline data block.
constexpr const char* END_OF_DATA = "e";

// Rows of space-separated columns, then END_OF_DATA on its own line.
void append_text_tuple(std::string& out, const Tuple& tuple);

// Point-major native doubles, no terminator. The plot command carries the
// record count instead.
void append_binary_tuple(std::string& out, const Tuple& tuple);

// Every curve of the chunk, in order.
std::string encode_chunk(const Chunk& chunk, bool binary);

}  // namespace plotpipe
