// ============================================================================
// field.cpp - implementation for field.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "tablestream/field.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>     // strtoll / strtod
#include <sstream>

namespace tablestream {

// ---------- local text helpers ----------

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// Split on '\n', dropping a trailing '\r' per line and the empty tail after the last newline.
static std::vector<std::string> split_lines(const std::string& raw) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < raw.size()) {
        size_t nl = raw.find('\n', start);
        if (nl == std::string::npos) nl = raw.size();
        std::string line = raw.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

// Strict integer parse: optional sign then digits only, whole string consumed.
static bool parse_int(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i == s.size()) return false;
    for (size_t k = i; k < s.size(); ++k)
        if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;

    errno = 0;
    char* e = nullptr;
    long long v = std::strtoll(s.c_str(), &e, 10);
    if (errno == ERANGE || !e || *e) return false;
    out = static_cast<int64_t>(v);
    return true;
}

static bool parse_float(const std::string& s, double& out) {
    if (s.empty()) return false;
    errno = 0;
    char* e = nullptr;
    double v = std::strtod(s.c_str(), &e);
    if (errno == ERANGE || !e || *e) return false;
    out = v;
    return true;
}


// ---------- FieldPath ----------

void FieldPath::append(const std::string& text) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t dot = text.find('.', start);
        if (dot == std::string::npos) dot = text.size();
        std::string seg = upper(trim(text.substr(start, dot - start)));
        if (!seg.empty()) {
            if (!text_.empty()) text_ += '.';
            text_ += seg;
            segments_.push_back(std::move(seg));
        }
        start = dot + 1;
    }
}

FieldPath FieldPath::parse(const std::string& text) {
    FieldPath p;
    p.append(text);
    return p;
}

FieldPath FieldPath::child(const std::string& segment) const {
    FieldPath p = *this;
    p.append(segment);
    return p;
}

std::string FieldPath::instance() const {
    return segments_.empty() ? std::string() : segments_.front();
}


// ---------- values ----------

std::string value_to_string(const Value& v) {
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) {
        std::ostringstream os;
        os << *d;
        return os.str();
    }
    if (auto s = std::get_if<std::string>(&v)) return *s;

    const auto& list = std::get<IntList>(v);
    std::string out;
    for (size_t i = 0; i < list.size(); ++i) {
        if (i) out += ' ';
        out += std::to_string(list[i]);
    }
    return out;
}

Value parse_scalar(const std::string& text) {
    const std::string t = trim(text);
    int64_t i = 0;
    if (parse_int(t, i)) return Value{i};
    double d = 0.0;
    if (parse_float(t, d)) return Value{d};
    return Value{t};
}


// ---------- response classification ----------
// Order matters: ERR and '!' are recognised by their first bytes, then any
// line carrying '=' is a read result ("OK =5" or "NAME=5"), then a bare OK.
bool classify_response(const std::string& raw, Response& out, Error& err) {
    out = Response{};

    if (raw.compare(0, 3, "ERR") == 0) {
        out.kind = ResponseKind::Error;
        out.message = trim(raw.substr(3));
        return true;
    }

    if (!raw.empty() && raw[0] == '!') {
        IntList items;
        bool terminated = false;
        for (const auto& line : split_lines(raw)) {
            if (line == ".") { terminated = true; break; }
            if (line.empty() || line[0] != '!')
                return err.set(ErrorKind::Protocol, "malformed list line: " + line);
            int64_t v = 0;
            if (!parse_int(trim(line.substr(1)), v))
                return err.set(ErrorKind::Protocol, "non-integer list item: " + line);
            items.push_back(v);
        }
        if (!terminated)
            return err.set(ErrorKind::Protocol, "list response missing '.' terminator");
        out.kind = ResponseKind::List;
        out.value = std::move(items);
        return true;
    }

    const auto lines = split_lines(raw);
    const std::string first = lines.empty() ? std::string() : lines.front();

    if (first == ".") {   // list with no items
        out.kind = ResponseKind::List;
        out.value = IntList{};
        return true;
    }

    size_t eq = first.find('=');
    if (eq != std::string::npos) {
        out.kind = ResponseKind::Value;
        out.value = parse_scalar(first.substr(eq + 1));
        return true;
    }

    if (first.compare(0, 2, "OK") == 0) {
        out.kind = ResponseKind::Ok;
        return true;
    }

    return err.set(ErrorKind::Protocol, "unexpected response: " + trim(raw));
}

} // namespace tablestream
