#pragma once
/**
 * @page ts-client tablestream Client Session
 * @file client.hpp
 * @brief One control-port session: field snapshot, typed field access, table writes.
 *
 * @details
 * PURPOSE
 * -------
 * Client is the explicit session object every tool and pipeline stage
 * holds. It owns one ControlChannel and the field snapshot fetched with
 * `*CHANGES?` when it connects. Nothing here is process-wide: two stages
 * that both need the wire each construct their own Client.
 *
 * FIELD ACCESS
 * ------------
 * Paths are composed explicitly instead of through attribute magic:
 *
 * @code
 *   tablestream::Client c{"panda"};
 *   tablestream::Error err;
 *   if (!c.connect(err)) { ... }
 *
 *   auto seq = c[c.find_first_instance("SEQ")];   // FieldHandle for "SEQ1"
 *   seq["REPEATS"].put(1, err);
 *   int64_t queued = 0;
 *   seq["TABLE"]["QUEUED_LINES"].get_int(queued, err);
 * @endcode
 *
 * SNAPSHOT
 * --------
 * The field list, the capture-field list and the instance set are filled
 * once at connect. They are not refreshed behind the caller's back; call
 * refresh_snapshot() or reconnect for live state.
 *
 * ERRORS
 * ------
 * - `ERR ...` answers and any write acknowledgment not starting with `OK`
 *   become ErrorKind::Device, prefixed with the field path.
 * - Read answers that fit no known shape become ErrorKind::Protocol.
 * - Socket failures come through as ErrorKind::Connection.
 */

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "tablestream/control_channel.hpp"
#include "tablestream/error.hpp"
#include "tablestream/field.hpp"
#include "tablestream/table_encoder.hpp"

namespace tablestream {

/** Default capture port of the device. */
static constexpr uint16_t CAPTURE_PORT = 8889;

struct ClientOptions {
    uint16_t control_port       = CONTROL_PORT;
    uint16_t capture_port       = CAPTURE_PORT;
    int      connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;
    SuffixConvention suffixes   = SuffixConvention::append_stream();
    size_t   words_per_line     = DEFAULT_WORDS_PER_LINE;
};

/** Result of a queue-depth wait: last value read and how many reads it took. */
struct QueueWait {
    int64_t queued = 0;
    int64_t peak   = 0;
    size_t  polls  = 0;
};

class Client;

/**
 * @brief A resolved field path bound to a session.
 *
 * Resolution is string composition only; the device is contacted on get/put.
 */
class FieldHandle {
public:
    FieldHandle(Client& client, FieldPath path) : client_(&client), path_(std::move(path)) {}

    FieldHandle operator[](const std::string& segment) const {
        return FieldHandle(*client_, path_.child(segment));
    }

    const FieldPath& path() const { return path_; }

    bool get(Value& out, Error& err) const;
    bool get_int(int64_t& out, Error& err) const;
    bool put(const std::string& value, Error& err) const;
    bool put(int64_t value, Error& err) const;
    bool put_table(const std::vector<uint32_t>& words, Error& err) const;

private:
    Client* client_;
    FieldPath path_;
};

class Client {
public:
    explicit Client(std::string host, ClientOptions options = {});

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /** Connect the control channel and fetch the `*CHANGES?` snapshot. */
    bool connect(Error& err);
    void close();

    /** Unblock a read in progress on another thread (failure propagation only). */
    void shutdown() { channel_.shutdown(); }

    bool refresh_snapshot(Error& err);

    FieldHandle resolve(const std::string& path) { return FieldHandle(*this, FieldPath::parse(path)); }
    FieldHandle operator[](const std::string& path) { return resolve(path); }

    /** Sorted-first instance whose name starts with @p prefix, empty if none. */
    std::string find_first_instance(const std::string& prefix) const;

    /** Snapshot fields matching the ECMAScript regex @p pattern anywhere. Bad regex -> Config error. */
    bool find_matching(const std::string& pattern, std::vector<std::string>& out, Error& err) const;

    /**
     * Names to read for a user argument. A plain field name is used as-is.
     * Anything with characters outside [A-Za-z0-9._] is a regex over the
     * snapshot; when it matches nothing the argument itself is read, so the
     * device reports the unknown field.
     */
    bool expand_names(const std::string& what, std::vector<std::string>& out, Error& err) const;

    const std::vector<std::string>& fields() const { return fields_; }
    const std::vector<std::string>& capture_fields() const { return capture_fields_; }
    const std::set<std::string>& instances() const { return instances_; }

    bool get(const FieldPath& path, Value& out, Error& err);
    bool get_int(const FieldPath& path, int64_t& out, Error& err);
    bool put(const FieldPath& path, const std::string& value, Error& err);

    /** One table write in @p mode; the device must answer OK. */
    bool put_table(const FieldPath& table, const uint32_t* words, size_t count,
                   TableMode mode, Error& err);

    bool arm(Error& err)    { return command("*PCAP.ARM=", err); }
    bool disarm(Error& err) { return command("*PCAP.DISARM=", err); }

    /** Write `No` to every capture field in the snapshot. */
    bool disable_captures(Error& err);

    /** Poll `<table>.QUEUED_LINES` until it is <= @p threshold. */
    bool wait_for_table_room(const FieldPath& table, int64_t threshold,
                             std::chrono::milliseconds interval, QueueWait& out, Error& err);

    /** Poll `<table>.QUEUED_LINES` until it is >= @p threshold. */
    bool wait_for_table_fill(const FieldPath& table, int64_t threshold,
                             std::chrono::milliseconds interval, QueueWait& out, Error& err);

    /**
     * Replay saved device state: one command per line, table writes
     * (lines holding '<') forwarded together with their data lines up to
     * the blank line. Every command must be acknowledged with OK.
     */
    bool load_state(const std::string& text, Error& err);

    const std::string& host() const { return host_; }
    const ClientOptions& options() const { return options_; }
    const TableEncoder& encoder() const { return encoder_; }

private:
    /** Send a raw command and require an OK acknowledgment. */
    bool command(const std::string& line, Error& err);
    bool send_expect_ok(const std::vector<std::string>& lines, const std::string& what, Error& err);
    bool wait_queue(const FieldPath& table, int64_t threshold, bool for_room,
                    std::chrono::milliseconds interval, QueueWait& out, Error& err);

    std::string host_;
    ClientOptions options_;
    TableEncoder encoder_;
    ControlChannel channel_;

    std::vector<std::string> fields_;
    std::vector<std::string> capture_fields_;
    std::set<std::string> instances_;
};

/** Queue depth field of a table: `<table>.QUEUED_LINES`. */
inline FieldPath queued_lines_path(const FieldPath& table) { return table.child("QUEUED_LINES"); }

} // namespace tablestream
