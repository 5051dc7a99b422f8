#include <doctest/doctest.h>
#include "tablestream/base64.hpp"
#include "tablestream/table_encoder.hpp"

#include <string>
#include <vector>

using namespace tablestream;

static std::vector<uint32_t> ramp(size_t n, uint32_t start = 0xFFFFFF00u) {
    std::vector<uint32_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = start + static_cast<uint32_t>(i * 2654435761u);
    return v;
}

TEST_CASE("words_per_line_for fits the 1024 character line limit") {
    CHECK(TableEncoder::words_per_line_for(MAX_LINE_LENGTH) == DEFAULT_WORDS_PER_LINE);
    CHECK(TableEncoder::words_per_line_for(MAX_LINE_LENGTH) == 191);
    CHECK(TableEncoder::words_per_line_for(8) == 1);
}

TEST_CASE("table write framing: open line, chunks, blank line") {
    TableEncoder enc;
    const auto words = ramp(400);
    const auto lines = enc.encode("SEQ1.TABLE", words, TableMode::StreamingFirst);

    REQUIRE(lines.size() == 1 + 3 + 1);   // 191 + 191 + 18 words
    CHECK(lines.front() == "SEQ1.TABLE<<B");
    CHECK(lines.back().empty());
    CHECK(lines[1].size() == 1020);
    CHECK(lines[2].size() == 1020);
    CHECK(lines[3].size() == base64::encoded_size(18 * 4));
    for (size_t i = 1; i + 1 < lines.size(); ++i) CHECK(lines[i].size() < MAX_LINE_LENGTH);
}

TEST_CASE("table round-trip across chunk boundaries") {
    TableEncoder enc;
    const size_t sizes[] = {0, 1, 190, 191, 192, 191 * 3 + 7};
    for (size_t n : sizes) {
        CAPTURE(n);
        const auto words = ramp(n);
        const auto lines = enc.encode("PGEN1.TABLE", words, TableMode::Single);
        CHECK(lines.size() == 2 + (n + 190) / 191);

        std::vector<uint32_t> back;
        Error err;
        REQUIRE(decode_table_lines(lines, back, err));
        CHECK(back == words);
    }
}

TEST_CASE("empty table is open line plus terminator") {
    TableEncoder enc;
    const auto lines = enc.encode("SEQ1.TABLE", std::vector<uint32_t>{}, TableMode::Single);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "SEQ1.TABLE<B");
    CHECK(lines[1].empty());
}

TEST_CASE("mode_for_block picks single or streaming modes") {
    CHECK(mode_for_block(0, 1) == TableMode::Single);
    CHECK(mode_for_block(0, 3) == TableMode::StreamingFirst);
    CHECK(mode_for_block(1, 3) == TableMode::StreamingContinue);
    CHECK(mode_for_block(2, 3) == TableMode::StreamingLast);
    CHECK(mode_for_block(0, 2) == TableMode::StreamingFirst);
    CHECK(mode_for_block(1, 2) == TableMode::StreamingLast);
}

TEST_CASE("suffix conventions are configurable") {
    const auto append = SuffixConvention::append_stream();
    CHECK(append.suffix(TableMode::Single) == "<");
    CHECK(append.suffix(TableMode::StreamingFirst) == "<<");
    CHECK(append.suffix(TableMode::StreamingContinue) == "<<");
    CHECK(append.suffix(TableMode::StreamingLast) == "<<|");

    const auto more = SuffixConvention::more_flag();
    CHECK(more.suffix(TableMode::Single) == "<");
    CHECK(more.suffix(TableMode::StreamingFirst) == "<|");
    CHECK(more.suffix(TableMode::StreamingLast) == "<");

    TableEncoder enc(more);
    CHECK(enc.encode("SEQ1.TABLE", std::vector<uint32_t>{1}, TableMode::StreamingContinue).front() ==
          "SEQ1.TABLE<|B");
}

TEST_CASE("words are serialized little-endian") {
    const uint32_t w[] = {0x04030201u};
    std::vector<uint8_t> bytes;
    words_to_bytes(w, 1, bytes);
    CHECK(bytes == std::vector<uint8_t>{1, 2, 3, 4});

    std::vector<uint32_t> back{7};
    bytes_to_words(bytes.data(), bytes.size(), back);
    CHECK(back == std::vector<uint32_t>{7, 0x04030201u});
}

TEST_CASE("decode_table_lines rejects a partial word") {
    std::vector<uint32_t> words;
    Error err;
    CHECK_FALSE(decode_table_lines({"SEQ1.TABLE<B", "AQID", ""}, words, err));
    CHECK(err.kind == ErrorKind::Protocol);
}
