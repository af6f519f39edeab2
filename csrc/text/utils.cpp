#include "text/utils.h"

#include <string>
#include <string_view>

#include "types.h"

namespace narrate {

namespace {

// The characters std::isspace accepts in the "C" locale.
constexpr std::string_view whitespace = " \t\n\v\f\r";

bool isSpace(char c) { return whitespace.find(c) != std::string_view::npos; }

bool isTerminal(char c) { return c == '.' or c == '!' or c == '?'; }

}  // namespace

std::string trim(std::string_view sv) {
    auto first = sv.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = sv.find_last_not_of(whitespace);
    return std::string(sv.substr(first, last - first + 1));
}

size_t utf8Length(std::string_view sv) {
    size_t n = 0;
    for (unsigned char c : sv) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

// Single linear pass: a boundary is a terminal mark followed by whitespace.
// The whole whitespace run after it is consumed.
StringList splitSentences(std::string_view text) {
    auto s = trim(text);
    std::string_view sv = s;
    StringList sentences;

    auto emit = [&](std::string_view piece) {
        auto sentence = trim(piece);
        if (not sentence.empty()) sentences.push_back(std::move(sentence));
    };

    size_t start = 0;
    size_t i = 0;
    while (i < sv.size()) {
        if (isTerminal(sv[i]) and i + 1 < sv.size() and isSpace(sv[i + 1])) {
            emit(sv.substr(start, i + 1 - start));
            i += 1;
            while (i < sv.size() and isSpace(sv[i])) ++i;
            start = i;
        } else {
            ++i;
        }
    }
    if (start < sv.size()) emit(sv.substr(start));
    return sentences;
}

}  // namespace narrate
