#pragma once
/**
 * @file field.hpp
 * @brief Field paths, field values, and classification of control-port responses.
 *
 * A device attribute is addressed by a dot-separated path of uppercase
 * segments, e.g. `SEQ1.TABLE.QUEUED_LINES`. FieldPath is a value type:
 * immutable once built, cheap to copy, and composed with child().
 *
 * Responses on the control port come in four shapes:
 *
 *   OK                 write acknowledged
 *   OK =42             read result (also accepted as NAME=42)
 *   ERR No such field  device refused the request
 *   !1 / !2 / .        multi-line list, closed by a line holding only "."
 *
 * classify_response() turns one complete response into a Response. It is a
 * pure function so the whole grammar is unit-testable without a socket.
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "tablestream/error.hpp"

namespace tablestream {

class FieldPath {
public:
    FieldPath() = default;

    /** Build from "seq1.table" style text; segments are upper-cased, empty segments dropped. */
    static FieldPath parse(const std::string& text);

    /** New path with @p segment appended (also split on '.', upper-cased). */
    FieldPath child(const std::string& segment) const;

    /** First segment, i.e. the block instance name ("SEQ1"). Empty for an empty path. */
    std::string instance() const;

    const std::vector<std::string>& segments() const { return segments_; }
    const std::string& str() const { return text_; }
    bool empty() const { return segments_.empty(); }

    bool operator==(const FieldPath& o) const { return text_ == o.text_; }
    bool operator!=(const FieldPath& o) const { return text_ != o.text_; }

private:
    void append(const std::string& text);

    std::vector<std::string> segments_;
    std::string text_;
};

using IntList = std::vector<int64_t>;

/** Parsed field value: integer, float, string, or list of integers. */
using Value = std::variant<int64_t, double, std::string, IntList>;

/** Render a value the way it would be written after `=` on the wire. */
std::string value_to_string(const Value& v);

/**
 * Parse the text after `=`: integer first, then float, else the raw
 * string (trimmed of surrounding whitespace).
 */
Value parse_scalar(const std::string& text);

enum class ResponseKind {
    Ok,      ///< plain acknowledgment
    Value,   ///< scalar read result
    List,    ///< multi-line '!' list
    Error    ///< ERR ...
};

struct Response {
    ResponseKind kind = ResponseKind::Ok;
    Value value;          ///< valid for Value and List
    std::string message;  ///< valid for Error
};

/**
 * @brief Classify one complete response (including trailing newlines).
 *
 * @return false with ErrorKind::Protocol when the bytes match none of the
 *         shapes above, or when a list item is not an integer.
 *         An `ERR` response is *not* a failure here; it classifies as
 *         ResponseKind::Error so callers can turn it into ErrorKind::Device
 *         with their own context.
 */
bool classify_response(const std::string& raw, Response& out, Error& err);

} // namespace tablestream
