#include <boost/test/unit_test.hpp>

#include <string>

#include "text/chunker.h"
#include "text/utils.h"

using namespace narrate;

namespace {

// A sentence of exactly n characters ending in a period.
std::string sentenceOf(size_t n, char fill = 'a') {
    return std::string(n - 1, fill) + ".";
}

std::string rejoin(ChunkList const& chunks) {
    std::string out;
    for (auto const& c : chunks) {
        if (not out.empty()) out += ' ';
        out += c.text;
    }
    return out;
}

std::string rejoin(StringList const& sentences) {
    std::string out;
    for (auto const& s : sentences) {
        if (not out.empty()) out += ' ';
        out += s;
    }
    return out;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(chunker)

BOOST_AUTO_TEST_CASE(short_text_is_one_chunk) {
    auto chunks = chunkText("Hello world. This is a test.", 800);
    BOOST_REQUIRE_EQUAL(chunks.size(), 1u);
    BOOST_TEST(chunks[0].index == 1u);
    BOOST_TEST(chunks[0].text == "Hello world. This is a test.");
}

BOOST_AUTO_TEST_CASE(two_long_sentences_split) {
    auto first = sentenceOf(500, 'a');
    auto second = sentenceOf(500, 'b');
    auto chunks = chunkText(first + " " + second, 800);
    BOOST_REQUIRE_EQUAL(chunks.size(), 2u);
    BOOST_TEST(chunks[0].text == first);
    BOOST_TEST(chunks[1].text == second);
    BOOST_TEST(chunks[1].index == 2u);
}

BOOST_AUTO_TEST_CASE(oversized_sentence_is_kept_whole) {
    auto sentence = sentenceOf(1000);
    auto chunks = chunkText(sentence, 800);
    BOOST_REQUIRE_EQUAL(chunks.size(), 1u);
    BOOST_TEST(chunks[0].text.size() == 1000u);
    BOOST_TEST(chunks[0].text == sentence);
}

BOOST_AUTO_TEST_CASE(oversized_sentence_between_short_ones) {
    auto text = "Short one. " + sentenceOf(900) + " Short two. Short three.";
    auto chunks = chunkText(text, 800);
    BOOST_REQUIRE_EQUAL(chunks.size(), 3u);
    BOOST_TEST(chunks[0].text == "Short one.");
    BOOST_TEST(chunks[1].text.size() == 900u);
    BOOST_TEST(chunks[2].text == "Short two. Short three.");
}

BOOST_AUTO_TEST_CASE(budget_counts_the_joining_space) {
    // 10 + 1 + 9 == 20 fits exactly, one more character does not.
    auto a = sentenceOf(10), b = sentenceOf(9), c = sentenceOf(10);
    BOOST_TEST(chunkText(a + " " + b, 20).size() == 1u);
    BOOST_TEST(chunkText(a + " " + c, 20).size() == 2u);
}

BOOST_AUTO_TEST_CASE(blank_text_has_no_chunks) {
    BOOST_TEST(chunkText("", 800).empty());
    BOOST_TEST(chunkText(" \n\t ", 800).empty());
}

BOOST_AUTO_TEST_CASE(splits_on_all_terminators_and_whitespace_runs) {
    auto sentences = splitSentences("  Wait!  Really?\nYes.\tDone  ");
    BOOST_REQUIRE_EQUAL(sentences.size(), 4u);
    BOOST_TEST(sentences[0] == "Wait!");
    BOOST_TEST(sentences[1] == "Really?");
    BOOST_TEST(sentences[2] == "Yes.");
    BOOST_TEST(sentences[3] == "Done");
}

BOOST_AUTO_TEST_CASE(no_split_without_following_whitespace) {
    auto sentences = splitSentences("Version 1.5 is out...really. Next.");
    BOOST_REQUIRE_EQUAL(sentences.size(), 2u);
    BOOST_TEST(sentences[0] == "Version 1.5 is out...really.");
    BOOST_TEST(sentences[1] == "Next.");
}

BOOST_AUTO_TEST_CASE(chunks_rebuild_the_sentence_sequence) {
    std::string text =
        "The quick brown fox jumps over the lazy dog. Pack my box with five "
        "dozen liquor jugs!  How vexingly quick daft zebras jump? Sphinx of "
        "black quartz, judge my vow.\n\nThe five boxing wizards jump quickly.";
    auto sentences = splitSentences(text);
    for (size_t budget : {1u, 20u, 50u, 90u, 200u, 10000u}) {
        auto chunks = chunkText(text, budget);
        BOOST_TEST(rejoin(chunks) == rejoin(sentences));
        for (size_t i = 0; i < chunks.size(); ++i) {
            auto const& c = chunks[i];
            BOOST_TEST(c.index == i + 1);
            BOOST_TEST(not c.text.empty());
            bool fits = utf8Length(c.text) <= budget;
            bool single = splitSentences(c.text).size() == 1u;
            BOOST_TEST((fits or single));
        }
    }
}

BOOST_AUTO_TEST_CASE(chunking_is_deterministic) {
    std::string text = "One. Two! Three? " + sentenceOf(300) + " Four.";
    auto first = chunkText(text, 100);
    for (int i = 0; i < 5; ++i) {
        auto again = chunkText(text, 100);
        BOOST_REQUIRE_EQUAL(again.size(), first.size());
        for (size_t k = 0; k < first.size(); ++k) {
            BOOST_TEST(again[k].text == first[k].text);
            BOOST_TEST(again[k].index == first[k].index);
        }
    }
}

BOOST_AUTO_TEST_CASE(budget_counts_code_points) {
    // 15 code points, 18 bytes.
    std::string a = "Émile était là.";
    BOOST_TEST(utf8Length(a) == 15u);
    BOOST_TEST(chunkText(a + " " + a, 31).size() == 1u);
    BOOST_TEST(chunkText(a + " " + a, 30).size() == 2u);
}

BOOST_AUTO_TEST_CASE(trim_strips_surrounding_whitespace) {
    BOOST_TEST(trim("  a b \n") == "a b");
    BOOST_TEST(trim("\t\n ") == "");
}

BOOST_AUTO_TEST_CASE(long_whitespace_runs_are_linear) {
    auto text = "First sentence." + std::string(200000, ' ') +
                "Second sentence.\n\n" + std::string(200000, '\n');
    auto chunks = chunkText(text, 800);
    BOOST_REQUIRE_EQUAL(chunks.size(), 1u);
    BOOST_TEST(chunks[0].text == "First sentence. Second sentence.");

    auto tight = chunkText(text, 20);
    BOOST_REQUIRE_EQUAL(tight.size(), 2u);
    BOOST_TEST(tight[0].text == "First sentence.");
    BOOST_TEST(tight[1].text == "Second sentence.");

    BOOST_TEST(trim(std::string(200000, ' ') + "x" + std::string(200000, '\t')) ==
               "x");
}

BOOST_AUTO_TEST_CASE(terminal_mark_needs_following_whitespace) {
    auto s = splitSentences("Wait... what?! Yes.\tNo");
    BOOST_REQUIRE_EQUAL(s.size(), 4u);
    BOOST_TEST(s[0] == "Wait...");
    BOOST_TEST(s[1] == "what?!");
    BOOST_TEST(s[2] == "Yes.");
    BOOST_TEST(s[3] == "No");
}

BOOST_AUTO_TEST_SUITE_END()
