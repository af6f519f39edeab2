#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace narrate {

// A sentence-bounded piece of the input, sized for one synthesize call.
struct Chunk {
    // 1-based position in the request.
    size_t index{};
    std::string text;
};

using ChunkList = std::vector<Chunk>;

// Group sentences greedily into chunks of at most maxChars code points,
// joining sentences with a single space. A sentence longer than maxChars is
// emitted whole as its own chunk. Returns an empty list for blank text.
ChunkList chunkText(std::string_view text, size_t maxChars);

}  // namespace narrate
