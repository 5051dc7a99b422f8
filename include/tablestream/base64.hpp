#pragma once

/**
 * @page ts-base64 tablestream Base64 Codec
 * @file base64.hpp
 * @brief Tiny RFC 4648 base64 encoder/decoder for table upload lines.
 *
 * @details
 * OVERVIEW
 * --------
 * Table writes on the control port are text: after the open command each
 * line carries one base64 chunk of raw little-endian table words. The
 * device decodes every line on its own, so each chunk must be a complete
 * base64 unit with its own padding.
 *
 * ENCODING RULES
 * --------------
 * - Standard alphabet (A-Z a-z 0-9 + /), '=' padding, no line wrapping.
 * - Every 3 input bytes become 4 output characters.
 * - A trailing 1 or 2 byte group becomes 4 characters with 2 or 1 '='.
 *
 * DECODING RULES
 * --------------
 * - Input length must be a multiple of 4.
 * - Padding may only appear in the last quantum.
 * - Any character outside the alphabet is rejected; the output is left
 *   with whatever was decoded before the bad quantum.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<uint8_t> raw = {0x00, 0x01, 0x02, 0x03};
 *   std::string line = tablestream::base64::encode(raw.data(), raw.size());
 *   // line == "AAECAw=="
 *
 *   std::vector<uint8_t> back;
 *   bool ok = tablestream::base64::decode(line, back);
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tablestream {
namespace base64 {

/** Standard base64 alphabet. */
static constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/** Padding character for short final groups. */
static constexpr char PAD = '=';

/** Number of characters produced for @p n input bytes. */
inline size_t encoded_size(size_t n) { return ((n + 2) / 3) * 4; }

/**
 * @brief Encode @p n bytes at @p in into one padded base64 string.
 */
inline std::string encode(const uint8_t* in, size_t n) {
    std::string out;
    out.reserve(encoded_size(n));

    size_t i = 0;
    for (; i + 3 <= n; i += 3) {
        uint32_t v = (uint32_t(in[i]) << 16) | (uint32_t(in[i + 1]) << 8) | in[i + 2];
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
        out.push_back(ALPHABET[v & 0x3F]);
    }

    size_t rest = n - i;
    if (rest == 1) {
        uint32_t v = uint32_t(in[i]) << 16;
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(PAD);
        out.push_back(PAD);
    } else if (rest == 2) {
        uint32_t v = (uint32_t(in[i]) << 16) | (uint32_t(in[i + 1]) << 8);
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
        out.push_back(PAD);
    }
    return out;
}

/** Map one alphabet character to its 6-bit value, or -1 if it is not in the alphabet. */
inline int sextet(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

/**
 * @brief Decode one padded base64 string, appending bytes to @p out.
 *
 * @return true if the whole input was valid base64; false on bad length,
 *         bad character, or misplaced padding.
 *
 * Appends instead of clearing so a caller can decode several table lines
 * into one buffer.
 */
inline bool decode(const std::string& in, std::vector<uint8_t>& out) {
    if (in.size() % 4 != 0) return false;

    out.reserve(out.size() + (in.size() / 4) * 3);
    for (size_t i = 0; i < in.size(); i += 4) {
        const bool last = (i + 4 == in.size());
        int pads = 0;
        if (in[i + 3] == PAD) ++pads;
        if (in[i + 2] == PAD) ++pads;
        if (pads && !last) return false;         // padding only in the final quantum
        if (pads == 1 && in[i + 2] == PAD) return false;

        int a = sextet(in[i]);
        int b = sextet(in[i + 1]);
        int c = pads >= 2 ? 0 : sextet(in[i + 2]);
        int d = pads >= 1 ? 0 : sextet(in[i + 3]);
        if (a < 0 || b < 0 || c < 0 || d < 0) return false;

        uint32_t v = (uint32_t(a) << 18) | (uint32_t(b) << 12) | (uint32_t(c) << 6) | uint32_t(d);
        out.push_back(uint8_t(v >> 16));
        if (pads < 2) out.push_back(uint8_t(v >> 8));
        if (pads < 1) out.push_back(uint8_t(v));
    }
    return true;
}

} // namespace base64
} // namespace tablestream
