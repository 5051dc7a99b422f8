#pragma once
/**
 * @file table_encoder.hpp
 * @brief Turn an ordered sequence of 32-bit table words into control-port table-write lines.
 *
 * Wire shape of one table write:
 *
 *   SEQ1.TABLE<<B          open line: path + mode suffix + 'B' (base64 payload)
 *   AQACAAAAAAD0AQAAAAAAAA==...
 *   ...                    one base64 line per chunk of words
 *                          blank line closes the write
 *
 * Words are serialized little-endian, exactly as the device stores them.
 * The default chunk of 191 words is 764 bytes, which base64-encodes to
 * 1020 characters and keeps every line under the device's 1024 byte limit.
 *
 * Which suffix means what has varied between firmware releases, so the
 * mapping from TableMode to suffix is a SuffixConvention value rather than
 * a constant.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "tablestream/error.hpp"

namespace tablestream {

enum class TableMode {
    Single,             ///< whole table in one write, replaces contents
    StreamingFirst,     ///< first block of a streamed table
    StreamingContinue,  ///< middle block
    StreamingLast       ///< final block; device stops expecting more
};

const char* to_string(TableMode mode);

/** Pick the mode for block @p index of @p total. A single block is never streamed. */
TableMode mode_for_block(size_t index, size_t total);

struct SuffixConvention {
    std::string single = "<";
    std::string first  = "<<";
    std::string cont   = "<<";
    std::string last   = "<<|";

    const std::string& suffix(TableMode mode) const;

    /** Append convention: `<` replace, `<<` more, `<<|` final (current firmware). */
    static SuffixConvention append_stream() { return SuffixConvention{}; }

    /** Older convention: `<|` means "more blocks follow", plain `<` ends the table. */
    static SuffixConvention more_flag() { return SuffixConvention{"<", "<|", "<|", "<"}; }
};

/** Device line limit, newline included. */
static constexpr size_t MAX_LINE_LENGTH = 1024;

/** Words per base64 line: 191 words -> 764 bytes -> 1020 characters. */
static constexpr size_t DEFAULT_WORDS_PER_LINE = 191;

class TableEncoder {
public:
    explicit TableEncoder(SuffixConvention convention = SuffixConvention::append_stream(),
                          size_t words_per_line = DEFAULT_WORDS_PER_LINE);

    /** Largest words-per-line whose base64 line (plus '\n') fits in @p max_line_length. */
    static size_t words_per_line_for(size_t max_line_length);

    /** Open line, data lines, blank line. */
    std::vector<std::string> encode(const std::string& path,
                                    const uint32_t* words, size_t count,
                                    TableMode mode) const;

    std::vector<std::string> encode(const std::string& path,
                                    const std::vector<uint32_t>& words,
                                    TableMode mode) const {
        return encode(path, words.data(), words.size(), mode);
    }

    size_t words_per_line() const { return words_per_line_; }
    const SuffixConvention& convention() const { return convention_; }

private:
    SuffixConvention convention_;
    size_t words_per_line_;
};

/**
 * @brief Reverse of TableEncoder::encode for the data lines.
 *
 * Accepts the full line list (open line and blank line included, both
 * skipped) or just the data lines. Fails with ErrorKind::Protocol on bad
 * base64 or a byte count that is not a multiple of 4.
 */
bool decode_table_lines(const std::vector<std::string>& lines,
                        std::vector<uint32_t>& words, Error& err);

/** Little-endian serialization helpers shared with the capture side. */
void words_to_bytes(const uint32_t* words, size_t count, std::vector<uint8_t>& out);
void bytes_to_words(const uint8_t* bytes, size_t n, std::vector<uint32_t>& out);

} // namespace tablestream
