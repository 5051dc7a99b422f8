// ============================================================================
// layout.cpp - implementation for layout.hpp
// ============================================================================

#include "tablestream/layout.hpp"

#include <cctype>
#include <utility>
#include <vector>

#include "tablestream/block.hpp"

namespace tablestream {

using Assignment = std::pair<std::string, std::string>;

static bool put_all(Client& client, const std::vector<Assignment>& writes, Error& err) {
    for (const auto& w : writes)
        if (!client.put(FieldPath::parse(w.first), w.second, err)) return false;
    return true;
}

bool require_instance(const Client& client, const std::string& prefix, std::string& out, Error& err) {
    out = client.find_first_instance(prefix);
    if (out.empty()) return err.set(ErrorKind::Device, "device has no " + prefix + " block");
    return true;
}

// PCAP settings shared by both layouts; delays differ.
static std::vector<Assignment> pcap_writes(const std::string& source, const std::string& clock,
                                           int enable_delay, int trig_delay) {
    return {
        {"PCAP.ENABLE",          source + ".ACTIVE"},
        {"PCAP.ENABLE.DELAY",    std::to_string(enable_delay)},
        {"PCAP.TRIG",            clock + ".OUT"},
        {"PCAP.TRIG.DELAY",      std::to_string(trig_delay)},
        {"PCAP.TRIG_EDGE",       "Rising"},
        {"PCAP.GATE",            "ONE"},
        {"PCAP.GATE.DELAY",      "0"},
        {"PCAP.SHIFT_SUM",       "0"},
        {"PCAP.TS_TRIG.CAPTURE", "No"},
    };
}

bool configure_seq_layout(Client& client, Error& err) {
    std::string seq, clock;
    if (!require_instance(client, "SEQ", seq, err)) return false;
    if (!require_instance(client, "CLOCK", clock, err)) return false;

    const std::vector<Assignment> seq_writes = {
        {seq + ".ENABLE",   "ZERO"},
        {seq + ".REPEATS",  "1"},
        {seq + ".PRESCALE", "0"},
        {seq + ".BITA",     clock + ".OUT"},
        {seq + ".BITB",     "ZERO"},
        {seq + ".BITC",     "ZERO"},
        {seq + ".POSA",     "ZERO"},
        {seq + ".POSB",     "ZERO"},
        {seq + ".POSC",     "ZERO"},
    };
    if (!put_all(client, seq_writes, err)) return false;
    if (!client.put_table(FieldPath::parse(seq).child("TABLE"), nullptr, 0, TableMode::Single, err))
        return false;

    const std::vector<Assignment> clock_writes = {
        {clock + ".ENABLE",       seq + ".ACTIVE"},
        {clock + ".ENABLE.DELAY", "0"},
        {clock + ".PERIOD.UNITS", "s"},
        {clock + ".WIDTH.UNITS",  "s"},
        {clock + ".WIDTH.RAW",    "1"},
    };
    if (!put_all(client, clock_writes, err)) return false;
    return put_all(client, pcap_writes(seq, clock, 1, 2), err);
}

bool configure_pgen_layout(Client& client, Error& err) {
    std::string pgen, clock;
    if (!require_instance(client, "PGEN", pgen, err)) return false;
    if (!require_instance(client, "CLOCK", clock, err)) return false;

    const std::vector<Assignment> pgen_writes = {
        {pgen + ".ENABLE",       "ZERO"},
        {pgen + ".OUT.UNITS",    ""},
        {pgen + ".OUT.OFFSET",   "0"},
        {pgen + ".OUT.SCALE",    "1"},
        {pgen + ".ENABLE.DELAY", "0"},
        {pgen + ".TRIG.DELAY",   "0"},
        {pgen + ".REPEATS",      "1"},
        {pgen + ".TRIG",         clock + ".OUT"},
    };
    if (!put_all(client, pgen_writes, err)) return false;
    if (!client.put_table(FieldPath::parse(pgen).child("TABLE"), nullptr, 0, TableMode::Single, err))
        return false;

    const std::vector<Assignment> clock_writes = {
        {clock + ".ENABLE",       pgen + ".ACTIVE"},
        {clock + ".ENABLE.DELAY", "0"},
        {clock + ".PERIOD.UNITS", "s"},
        {clock + ".WIDTH.UNITS",  "s"},
        {clock + ".PERIOD",       "1"},
        {clock + ".WIDTH",        "0"},
    };
    if (!put_all(client, clock_writes, err)) return false;
    if (!put_all(client, pcap_writes(pgen, clock, 10, 1), err)) return false;
    return client.put(FieldPath::parse(pgen + ".OUT.CAPTURE"), "Value", err);
}

// "BITS2" -> 2
static bool capture_word_number(const FieldPath& path, const Value& v, unsigned& out, Error& err) {
    const std::string s = value_to_string(v);
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.back())))
        return err.set(ErrorKind::Protocol, path.str() + " is not a BITS word: " + s);
    out = static_cast<unsigned>(s.back() - '0');
    return true;
}

bool read_seq_offsets(Client& client, SeqCaptureMap& out, Error& err) {
    std::string seq;
    if (!require_instance(client, "SEQ", seq, err)) return false;
    const FieldPath base = FieldPath::parse(seq);

    static const char* const OUTPUTS[SEQ_OUTPUTS] = {"OUTA", "OUTB", "OUTC", "OUTD", "OUTE", "OUTF"};
    for (size_t k = 0; k < SEQ_OUTPUTS; ++k) {
        const FieldPath out_path = base.child(OUTPUTS[k]);

        int64_t offset = 0;
        if (!client.get_int(out_path.child("OFFSET"), offset, err)) return false;
        if (offset < 0 || offset > 31)
            return err.set(ErrorKind::Device, out_path.str() + ".OFFSET out of range: " + std::to_string(offset));
        out.offsets[k] = static_cast<unsigned>(offset);

        const FieldPath word_path = out_path.child("CAPTURE_WORD");
        Value word;
        if (!client.get(word_path, word, err)) return false;
        unsigned n = 0;
        if (!capture_word_number(word_path, word, n, err)) return false;
        if (k == 0) {
            out.bits_word = n;
        } else if (n != out.bits_word) {
            return err.set(ErrorKind::Device, "seq outputs span BITS" + std::to_string(out.bits_word) +
                                              " and BITS" + std::to_string(n));
        }
    }
    return true;
}

bool set_clock_period(Client& client, double period_us, uint32_t fpga_freq, Error& err) {
    std::string clock;
    if (!require_instance(client, "CLOCK", clock, err)) return false;
    return client.put(FieldPath::parse(clock + ".PERIOD.RAW"),
                      std::to_string(clock_ticks(period_us, fpga_freq)), err);
}

} // namespace tablestream
