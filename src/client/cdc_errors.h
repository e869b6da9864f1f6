#ifndef CDC_ERRORS_H
#define CDC_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

// =============================================================================
// ERROR TAXONOMY
// =============================================================================
// All errors raised by the client are CdcError subclasses. Each maps to one
// process exit code in client.cpp.
// =============================================================================
class CdcError : public std::runtime_error {
public:
    explicit CdcError(const std::string& what) : std::runtime_error(what) {}
};

// Transport could not be established. Never retried.
class ConnectionError : public CdcError {
public:
    explicit ConnectionError(const std::string& what) : CdcError(what) {}
};

// Send/receive failure on an established connection.
class IOError : public CdcError {
public:
    explicit IOError(const std::string& what) : CdcError(what) {}
};

// Rejected before any network activity.
class ConfigurationError : public CdcError {
public:
    explicit ConfigurationError(const std::string& what) : CdcError(what) {}
};

// The idle-retry budget ran out: too many consecutive empty reads.
class FramingExhaustion : public CdcError {
public:
    FramingExhaustion(int idle_reads, const std::string& what)
        : CdcError(what), idle_reads_(idle_reads) {}
    int idle_reads() const { return idle_reads_; }
private:
    int idle_reads_;
};

// A complete record that is not valid JSON.
class MalformedRecord : public CdcError {
public:
    MalformedRecord(size_t stream_offset, const std::string& what)
        : CdcError(what), stream_offset_(stream_offset) {}
    size_t stream_offset() const { return stream_offset_; }
private:
    size_t stream_offset_;
};

#endif
