// ============================================================================
// checker.cpp - implementation for checker.hpp
// ============================================================================

#include "tablestream/checker.hpp"

#include <sstream>
#include <utility>

namespace tablestream {

WordDecoder identity_decoder() {
    return [](uint32_t w) { return w; };
}

WordDecoder bit_extract_decoder(const SeqOffsets& offsets) {
    return [offsets](uint32_t w) {
        uint32_t v = 0;
        for (size_t k = 0; k < offsets.size(); ++k)
            v |= ((w >> offsets[k]) & 1u) << k;
        return v;
    };
}

bool check_block(size_t block, const std::vector<uint32_t>& captured,
                 const std::vector<uint32_t>& expected, const WordDecoder& decode,
                 Error& err) {
    if (captured.size() != expected.size()) {
        std::ostringstream os;
        os << "block " << block << ": captured " << captured.size()
           << " values, expected " << expected.size();
        return err.set(ErrorKind::Verification, os.str());
    }

    for (size_t j = 0; j < captured.size(); ++j) {
        const uint32_t got = decode(captured[j]);
        if (got != expected[j]) {
            std::ostringstream os;
            os << "block " << block << " line " << j << ": expected "
               << expected[j] << ", got " << got << " (raw 0x" << std::hex
               << captured[j] << ")";
            return err.set(ErrorKind::Verification, os.str());
        }
    }
    return true;
}

bool Checker::check(size_t block, const std::vector<uint32_t>& captured,
                    const std::vector<uint32_t>& expected, Error& err) {
    if (!check_block(block, captured, expected, decode_, err)) return false;
    checked_values_ += captured.size();
    ++checked_blocks_;
    return true;
}

} // namespace tablestream
