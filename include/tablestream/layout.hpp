#pragma once
/**
 * @file layout.hpp
 * @brief Device wiring for the SEQ and PGEN validation runs.
 *
 * Both layouts drive the table block from a CLOCK instance gated by the
 * block's own ACTIVE output and capture one word per clock edge through
 * PCAP. Instance names are discovered from the client snapshot (first SEQ,
 * first PGEN, first CLOCK in sorted order).
 */

#include <cstdint>
#include <string>

#include "tablestream/checker.hpp"
#include "tablestream/client.hpp"
#include "tablestream/error.hpp"

namespace tablestream {

/** First instance named @p prefix, or Device error if the device has none. */
bool require_instance(const Client& client, const std::string& prefix, std::string& out, Error& err);

bool configure_seq_layout(Client& client, Error& err);
bool configure_pgen_layout(Client& client, Error& err);

/** Where the six SEQ outputs appear on the capture stream. */
struct SeqCaptureMap {
    unsigned bits_word = 0;   ///< N of PCAP.BITSN
    SeqOffsets offsets{};     ///< bit offset of OUTA..OUTF within that word
};

/** Read OUTA..OUTF OFFSET and CAPTURE_WORD; all outputs must share one BITS word. */
bool read_seq_offsets(Client& client, SeqCaptureMap& out, Error& err);

/** `<CLOCK>.PERIOD.RAW = floor(period_us * 1e-6 * fpga_freq)`. */
bool set_clock_period(Client& client, double period_us, uint32_t fpga_freq, Error& err);

} // namespace tablestream
