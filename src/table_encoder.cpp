// ============================================================================
// table_encoder.cpp - implementation for table_encoder.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "tablestream/table_encoder.hpp"
#include "tablestream/base64.hpp"

#include <algorithm>
#include <utility>

namespace tablestream {

const char* to_string(TableMode mode) {
    switch (mode) {
        case TableMode::Single:            return "single";
        case TableMode::StreamingFirst:    return "streaming-first";
        case TableMode::StreamingContinue: return "streaming-continue";
        case TableMode::StreamingLast:     return "streaming-last";
    }
    return "unknown";
}

TableMode mode_for_block(size_t index, size_t total) {
    if (total <= 1)          return TableMode::Single;
    if (index == 0)          return TableMode::StreamingFirst;
    if (index + 1 == total)  return TableMode::StreamingLast;
    return TableMode::StreamingContinue;
}

const std::string& SuffixConvention::suffix(TableMode mode) const {
    switch (mode) {
        case TableMode::Single:            return single;
        case TableMode::StreamingFirst:    return first;
        case TableMode::StreamingContinue: return cont;
        case TableMode::StreamingLast:     return last;
    }
    return single;
}


// ---------- byte order ----------

void words_to_bytes(const uint32_t* words, size_t count, std::vector<uint8_t>& out) {
    out.resize(count * 4);
    for (size_t i = 0; i < count; ++i) {
        uint32_t w = words[i];
        out[i * 4 + 0] = uint8_t(w);
        out[i * 4 + 1] = uint8_t(w >> 8);
        out[i * 4 + 2] = uint8_t(w >> 16);
        out[i * 4 + 3] = uint8_t(w >> 24);
    }
}

void bytes_to_words(const uint8_t* bytes, size_t n, std::vector<uint32_t>& out) {
    const size_t count = n / 4;
    out.reserve(out.size() + count);
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* b = bytes + i * 4;
        out.push_back(uint32_t(b[0]) | (uint32_t(b[1]) << 8) |
                      (uint32_t(b[2]) << 16) | (uint32_t(b[3]) << 24));
    }
}


// ---------- TableEncoder ----------

TableEncoder::TableEncoder(SuffixConvention convention, size_t words_per_line)
    : convention_(std::move(convention)),
      words_per_line_(words_per_line ? words_per_line : 1) {}

size_t TableEncoder::words_per_line_for(size_t max_line_length) {
    // base64 line of w words is ceil(4w/3)*4 characters, plus the newline.
    size_t w = 0;
    while (base64::encoded_size((w + 1) * 4) + 1 <= max_line_length) ++w;
    return std::max<size_t>(w, 1);
}

std::vector<std::string> TableEncoder::encode(const std::string& path,
                                              const uint32_t* words, size_t count,
                                              TableMode mode) const {
    std::vector<std::string> lines;
    lines.reserve(2 + (count + words_per_line_ - 1) / words_per_line_);
    lines.push_back(path + convention_.suffix(mode) + "B");

    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < count; i += words_per_line_) {
        const size_t n = std::min(words_per_line_, count - i);
        words_to_bytes(words + i, n, bytes);
        lines.push_back(base64::encode(bytes.data(), bytes.size()));
    }

    lines.emplace_back();  // blank line terminates the write
    return lines;
}


bool decode_table_lines(const std::vector<std::string>& lines,
                        std::vector<uint32_t>& words, Error& err) {
    words.clear();
    std::vector<uint8_t> bytes;
    for (const auto& line : lines) {
        if (line.empty()) continue;                         // terminator
        if (line.find('<') != std::string::npos) continue;  // open line
        if (!base64::decode(line, bytes))
            return err.set(ErrorKind::Protocol, "bad base64 table line");
    }
    if (bytes.size() % 4 != 0)
        return err.set(ErrorKind::Protocol,
                       "table payload of " + std::to_string(bytes.size()) +
                       " bytes is not a whole number of words");
    bytes_to_words(bytes.data(), bytes.size(), words);
    return true;
}

} // namespace tablestream
