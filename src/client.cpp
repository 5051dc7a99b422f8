// ============================================================================
// client.cpp - implementation for client.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "tablestream/client.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <thread>

namespace tablestream {

// ---------- FieldHandle ----------

bool FieldHandle::get(Value& out, Error& err) const { return client_->get(path_, out, err); }

bool FieldHandle::get_int(int64_t& out, Error& err) const { return client_->get_int(path_, out, err); }

bool FieldHandle::put(const std::string& value, Error& err) const { return client_->put(path_, value, err); }

bool FieldHandle::put(int64_t value, Error& err) const {
    return client_->put(path_, std::to_string(value), err);
}

bool FieldHandle::put_table(const std::vector<uint32_t>& words, Error& err) const {
    return client_->put_table(path_, words.data(), words.size(), TableMode::Single, err);
}


// ---------- Client ----------

Client::Client(std::string host, ClientOptions options)
    : host_(std::move(host)),
      options_(std::move(options)),
      encoder_(options_.suffixes, options_.words_per_line) {}

bool Client::connect(Error& err) {
    if (!channel_.connect(host_, options_.control_port, options_.connect_timeout_ms, err))
        return false;
    return refresh_snapshot(err);
}

void Client::close() { channel_.close(); }

// *CHANGES? answers one "!NAME=value" line per field and closes with ".".
// Lines without '=' (table markers such as "!SEQ1.TABLE<") carry no value
// and are not part of the field list.
bool Client::refresh_snapshot(Error& err) {
    std::string raw;
    if (!channel_.request({"*CHANGES?"}, raw, err)) return false;
    if (raw.compare(0, 3, "ERR") == 0)
        return err.set(ErrorKind::Device, "*CHANGES?: " + raw.substr(0, raw.find('\n')));

    fields_.clear();
    capture_fields_.clear();
    instances_.clear();

    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos || line.empty() || line[0] != '!') continue;

        std::string field = line.substr(1, eq - 1);
        if (field.find(".CAPTURE") != std::string::npos) capture_fields_.push_back(field);
        instances_.insert(field.substr(0, field.find('.')));
        fields_.push_back(std::move(field));
    }
    return true;
}

std::string Client::find_first_instance(const std::string& prefix) const {
    // std::set iterates in sorted order
    for (const auto& inst : instances_) {
        if (inst.compare(0, prefix.size(), prefix) == 0) return inst;
    }
    return {};
}

bool Client::find_matching(const std::string& pattern, std::vector<std::string>& out, Error& err) const {
    out.clear();
    std::regex re;
    try {
        re = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return err.set(ErrorKind::Config, "bad field pattern '" + pattern + "': " + e.what());
    }
    for (const auto& f : fields_) {
        if (std::regex_search(f, re)) out.push_back(f);
    }
    return true;
}

static bool looks_like_pattern(const std::string& s) {
    for (char c : s) {
        const bool plain = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                           (c >= '0' && c <= '9') || c == '.' || c == '_';
        if (!plain) return true;
    }
    return false;
}

bool Client::expand_names(const std::string& what, std::vector<std::string>& out, Error& err) const {
    out.clear();
    if (looks_like_pattern(what) && !find_matching(what, out, err)) return false;
    if (out.empty()) out.push_back(what);
    return true;
}

bool Client::get(const FieldPath& path, Value& out, Error& err) {
    std::string raw;
    if (!channel_.request({path.str() + "?"}, raw, err)) return false;

    Response resp;
    if (!classify_response(raw, resp, err)) {
        err.message = path.str() + ": " + err.message;
        return false;
    }

    switch (resp.kind) {
        case ResponseKind::Error:
            return err.set(ErrorKind::Device, "error getting " + path.str() + ": " + resp.message);
        case ResponseKind::Ok:
            return err.set(ErrorKind::Protocol, "no value in response for " + path.str());
        case ResponseKind::Value:
        case ResponseKind::List:
            out = std::move(resp.value);
            return true;
    }
    return err.set(ErrorKind::Protocol, "unhandled response for " + path.str());
}

bool Client::get_int(const FieldPath& path, int64_t& out, Error& err) {
    Value v;
    if (!get(path, v, err)) return false;
    if (auto i = std::get_if<int64_t>(&v)) {
        out = *i;
        return true;
    }
    return err.set(ErrorKind::Protocol,
                   path.str() + " is not an integer: " + value_to_string(v));
}

bool Client::send_expect_ok(const std::vector<std::string>& lines, const std::string& what, Error& err) {
    std::string raw;
    if (!channel_.request(lines, raw, err)) return false;
    if (raw.compare(0, 2, "OK") == 0) return true;

    std::string text = raw.substr(0, raw.find('\n'));
    if (text.compare(0, 3, "ERR") == 0) {
        size_t b = text.find_first_not_of(' ', 3);
        text = (b == std::string::npos) ? std::string() : text.substr(b);
    }
    return err.set(ErrorKind::Device, "error putting " + what + ": " + text);
}

bool Client::command(const std::string& line, Error& err) {
    return send_expect_ok({line}, line, err);
}

bool Client::put(const FieldPath& path, const std::string& value, Error& err) {
    return send_expect_ok({path.str() + "=" + value}, path.str(), err);
}

bool Client::put_table(const FieldPath& table, const uint32_t* words, size_t count,
                       TableMode mode, Error& err) {
    return send_expect_ok(encoder_.encode(table.str(), words, count, mode), table.str(), err);
}

bool Client::disable_captures(Error& err) {
    for (const auto& f : capture_fields_) {
        if (!put(FieldPath::parse(f), "No", err)) return false;
    }
    return true;
}

bool Client::wait_queue(const FieldPath& table, int64_t threshold, bool for_room,
                        std::chrono::milliseconds interval, QueueWait& out, Error& err) {
    const FieldPath q = queued_lines_path(table);
    out = QueueWait{};
    while (true) {
        int64_t queued = 0;
        if (!get_int(q, queued, err)) return false;
        ++out.polls;
        out.queued = queued;
        out.peak = std::max(out.peak, queued);

        if (for_room ? (queued <= threshold) : (queued >= threshold)) return true;
        std::this_thread::sleep_for(interval);
    }
}

bool Client::wait_for_table_room(const FieldPath& table, int64_t threshold,
                                 std::chrono::milliseconds interval, QueueWait& out, Error& err) {
    return wait_queue(table, threshold, true, interval, out, err);
}

bool Client::wait_for_table_fill(const FieldPath& table, int64_t threshold,
                                 std::chrono::milliseconds interval, QueueWait& out, Error& err) {
    return wait_queue(table, threshold, false, interval, out, err);
}

bool Client::load_state(const std::string& text, Error& err) {
    std::istringstream in(text);
    std::string line;
    std::vector<std::string> table;
    bool reading_table = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (reading_table) {
            table.push_back(line);
            if (line.empty()) {
                if (!send_expect_ok(table, table.front(), err)) return false;
                table.clear();
                reading_table = false;
            }
        } else if (line.find('<') != std::string::npos) {
            table.push_back(line);
            reading_table = true;
        } else if (!line.empty()) {
            if (!command(line, err)) return false;
        }
    }

    if (reading_table)
        return err.set(ErrorKind::Config, "state ends inside table write " + table.front());
    return true;
}

} // namespace tablestream
