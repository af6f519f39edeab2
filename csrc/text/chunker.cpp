#include "text/chunker.h"

#include "text/utils.h"

namespace narrate {

ChunkList chunkText(std::string_view text, size_t maxChars) {
    ChunkList chunks;
    std::string current;
    size_t currentLength = 0;

    auto close = [&] {
        chunks.push_back({chunks.size() + 1, std::move(current)});
        current.clear();
        currentLength = 0;
    };

    for (auto& sentence : splitSentences(text)) {
        size_t length = utf8Length(sentence);
        if (current.empty()) {
            current = std::move(sentence);
            currentLength = length;
        } else if (currentLength + 1 + length <= maxChars) {
            current += ' ';
            current += sentence;
            currentLength += 1 + length;
        } else {
            close();
            current = std::move(sentence);
            currentLength = length;
        }
    }
    if (not current.empty()) close();
    return chunks;
}

}  // namespace narrate
