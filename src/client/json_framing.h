#ifndef JSON_FRAMING_H
#define JSON_FRAMING_H

#include <cstddef>
#include <string>

// =============================================================================
// JSON VALUE FRAMING
// =============================================================================
// Finds the byte range of the first JSON value in a buffer that holds
// concatenated values with no guaranteed separator, e.g. {"a":1}{"b":2}.
//
//   Complete  value occupies [begin, end); end is the number of bytes to
//             consume (leading whitespace included)
//   NeedMore  the value is not finished yet, nothing may be consumed
//   Invalid   the bytes at `begin` can never start a JSON value
//
// Only structure is checked here (brackets, strings, escapes). The complete
// slice is validated by the JSON parser afterwards.
// =============================================================================
enum class ScanStatus { Complete, NeedMore, Invalid };

struct ScanResult {
    ScanStatus status;
    size_t begin;
    size_t end;
};

inline bool is_json_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

inline bool is_json_delimiter(char c) {
    return is_json_ws(c) || c == ',' || c == ':' || c == '[' || c == ']'
        || c == '{' || c == '}' || c == '"';
}

inline ScanResult scan_json_value(const char* data, size_t len) {
    size_t i = 0;
    while (i < len && is_json_ws(data[i])) i++;
    if (i == len) return {ScanStatus::NeedMore, i, i};

    const size_t begin = i;
    const char first = data[i];

    if (first == '{' || first == '[') {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (; i < len; i++) {
            char c = data[i];
            if (in_string) {
                if (escaped) escaped = false;
                else if (c == '\\') escaped = true;
                else if (c == '"') in_string = false;
                continue;
            }
            if (c == '"') in_string = true;
            else if (c == '{' || c == '[') depth++;
            else if (c == '}' || c == ']') {
                if (--depth == 0) return {ScanStatus::Complete, begin, i + 1};
            }
        }
        return {ScanStatus::NeedMore, begin, begin};
    }

    if (first == '"') {
        bool escaped = false;
        for (i = begin + 1; i < len; i++) {
            char c = data[i];
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') return {ScanStatus::Complete, begin, i + 1};
        }
        return {ScanStatus::NeedMore, begin, begin};
    }

    if (first == '-' || (first >= '0' && first <= '9') || first == 't' || first == 'f' || first == 'n') {
        // A number or literal ends at the next delimiter; at the buffer end it
        // may still continue in the next chunk.
        for (i = begin + 1; i < len; i++) {
            if (is_json_delimiter(data[i])) return {ScanStatus::Complete, begin, i};
        }
        return {ScanStatus::NeedMore, begin, begin};
    }

    return {ScanStatus::Invalid, begin, begin};
}

inline ScanResult scan_json_value(const std::string& buf) {
    return scan_json_value(buf.data(), buf.size());
}

#endif
