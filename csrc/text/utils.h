#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "types.h"

namespace narrate {
// Trim initial and terminal whitespace.
std::string trim(std::string_view sv);

// Number of code points in a UTF-8 string. Continuation bytes are not
// counted, so a budget means the same for accented and plain text.
size_t utf8Length(std::string_view sv);

// Split text after '.', '!' or '?' followed by whitespace. Each sentence is
// trimmed and keeps its terminal punctuation. Empty pieces are dropped.
StringList splitSentences(std::string_view text);

}  // namespace narrate
