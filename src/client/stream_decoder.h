#ifndef STREAM_DECODER_H
#define STREAM_DECODER_H

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <simdjson.h>

#include "client_protocol.h"
#include "cdc_errors.h"
#include "cdc_session.h"
#include "json_framing.h"
#include "transport.h"

// =============================================================================
// STREAM OPTIONS
// =============================================================================
enum class InvalidJsonPolicy { Fail, Retry };

struct StreamOptions {
    std::chrono::milliseconds read_timeout{DEFAULT_READ_TIMEOUT_MS};  // JSON: 0 blocks forever
    std::chrono::milliseconds poll_delay{DEFAULT_POLL_DELAY_MS};      // AVRO: pause after an empty poll
    int    max_idle_reads    = DEFAULT_MAX_IDLE_READS;
    size_t recv_buffer_bytes = DEFAULT_RECV_BUFFER_BYTES;
    InvalidJsonPolicy invalid_json = InvalidJsonPolicy::Fail;

    // Optional cancellation: the decoders stop once this reads false.
    const std::atomic<bool>* running = nullptr;
    // Optional replacement for the poll delay sleep (tests).
    std::function<void(std::chrono::milliseconds)> sleep;
};

inline InvalidJsonPolicy parse_invalid_json_policy(const std::string& name) {
    std::string v = to_lower_ascii(name);
    if (v == "fail") return InvalidJsonPolicy::Fail;
    if (v == "retry") return InvalidJsonPolicy::Retry;
    throw ConfigurationError("invalid value for invalid_json: '" + name + "', expected fail or retry");
}

inline StreamOptions make_stream_options(const AppConfig& conf) {
    StreamOptions o;
    int read_timeout = require_int(conf, "read_timeout_ms", DEFAULT_READ_TIMEOUT_MS);
    int poll_delay   = require_int(conf, "poll_delay_ms", DEFAULT_POLL_DELAY_MS);
    int recv_bytes   = require_int(conf, "recv_buffer_bytes", static_cast<int>(DEFAULT_RECV_BUFFER_BYTES));
    o.max_idle_reads = require_int(conf, "max_idle_reads", DEFAULT_MAX_IDLE_READS);
    o.invalid_json   = parse_invalid_json_policy(conf.get("invalid_json", "fail"));

    if (read_timeout < 0) throw ConfigurationError("read_timeout_ms must not be negative");
    if (poll_delay < 0) throw ConfigurationError("poll_delay_ms must not be negative");
    if (recv_bytes <= 0) throw ConfigurationError("recv_buffer_bytes must be positive");
    if (o.max_idle_reads <= 0) throw ConfigurationError("max_idle_reads must be positive");

    o.read_timeout = std::chrono::milliseconds(read_timeout);
    o.poll_delay = std::chrono::milliseconds(poll_delay);
    o.recv_buffer_bytes = static_cast<size_t>(recv_bytes);
    return o;
}

// =============================================================================
// IDLE COUNTER
// =============================================================================
// Consecutive empty reads. Any received byte resets it.
// =============================================================================
class IdleCounter {
public:
    explicit IdleCounter(int limit) : limit_(limit) {}

    void reset() { count_ = 0; }
    // Returns true once the limit is reached.
    bool record_empty() { return ++count_ >= limit_; }

    int count() const { return count_; }
    int limit() const { return limit_; }

private:
    int limit_;
    int count_ = 0;
};

namespace detail {

inline bool keep_running(const StreamOptions& o) {
    return o.running == nullptr || o.running->load();
}

inline FramingExhaustion idle_exhausted(const IdleCounter& idle) {
    return FramingExhaustion(idle.count(), "no data from server after " + std::to_string(idle.count())
                                               + " consecutive empty reads");
}

} // namespace detail

// =============================================================================
// JSON STREAM DECODER
// =============================================================================
// Lazy, unbounded and non-restartable sequence of JSON records. Every record
// is cut from the front of the receive buffer; the buffer keeps exactly the
// unconsumed tail. One receive may carry several records, and a record may
// span several receives.
//
// next() returns an empty optional when the server closes the connection
// between records or the cancellation flag drops. It throws FramingExhaustion
// after max_idle_reads consecutive empty reads, IOError when the connection
// closes inside a record, and MalformedRecord for a complete non-JSON record
// under InvalidJsonPolicy::Fail.
// =============================================================================
struct JsonRecord {
    std::string json;       // minified
    size_t      offset = 0; // stream offset of the first byte of the value
    size_t      length = 0;
};

class JsonStreamDecoder {
public:
    JsonStreamDecoder(Transport& transport, StreamOptions options, AsyncLogger* logger = nullptr)
        : transport_(transport), opts_(std::move(options)), logger_(logger), idle_(opts_.max_idle_reads) {}

    JsonStreamDecoder(const JsonStreamDecoder&) = delete;
    JsonStreamDecoder& operator=(const JsonStreamDecoder&) = delete;

    std::optional<JsonRecord> next() {
        if (finished_) return std::nullopt;

        JsonRecord record;
        while (detail::keep_running(opts_)) {
            if (try_extract(record)) {
                idle_.reset();
                return record;
            }

            RecvResult r = transport_.receive(opts_.recv_buffer_bytes, RecvMode::Blocking, opts_.read_timeout);
            if (r.status == RecvStatus::Data) {
                buffer_ += r.bytes;
                idle_.reset();
                continue;
            }
            if (r.status == RecvStatus::Closed) {
                finish_on_close();
                return std::nullopt;
            }
            // An interrupted wait is not an idle read.
            if (!detail::keep_running(opts_)) break;
            if (idle_.record_empty()) {
                finished_ = true;
                throw detail::idle_exhausted(idle_);
            }
            log_to(logger_, AsyncLogger::DEBUG, "Waiting for data (" + std::to_string(idle_.count()) + "/"
                                                + std::to_string(idle_.limit()) + " empty reads)");
        }
        finished_ = true;
        return std::nullopt;
    }

    // Bytes handed out as records (separating whitespace included).
    size_t consumed_bytes() const { return consumed_; }
    // Received bytes not consumed yet.
    const std::string& pending() const { return buffer_; }
    int idle_reads() const { return idle_.count(); }
    bool finished() const { return finished_; }

private:
    bool try_extract(JsonRecord& out) {
        ScanResult scan = scan_json_value(buffer_);
        if (scan.status == ScanStatus::NeedMore) return false;

        if (scan.status == ScanStatus::Complete) {
            simdjson::dom::element doc;
            auto error = parser_.parse(buffer_.data() + scan.begin, scan.end - scan.begin).get(doc);
            if (!error) {
                out.json = simdjson::minify(doc);
                out.offset = consumed_ + scan.begin;
                out.length = scan.end - scan.begin;
                buffer_.erase(0, scan.end);
                consumed_ += scan.end;
                return true;
            }
            return reject(consumed_ + scan.begin, simdjson::error_message(error));
        }
        return reject(consumed_ + scan.begin, "unexpected character");
    }

    bool reject(size_t offset, const std::string& reason) {
        const std::string what = "malformed JSON at stream offset " + std::to_string(offset) + ": " + reason;
        if (opts_.invalid_json == InvalidJsonPolicy::Fail) {
            finished_ = true;
            throw MalformedRecord(offset, what);
        }
        if (offset != last_rejected_offset_) {
            log_to(logger_, AsyncLogger::WARN, what + " (waiting for more data)");
            last_rejected_offset_ = offset;
        }
        return false;
    }

    // A close between records ends the stream; a close inside one loses data.
    void finish_on_close() {
        finished_ = true;
        size_t pos = 0;
        while (pos < buffer_.size() && is_json_ws(buffer_[pos])) pos++;
        if (pos < buffer_.size()) {
            throw IOError("server closed the stream inside a record at stream offset "
                          + std::to_string(consumed_ + pos) + " (" + std::to_string(buffer_.size() - pos)
                          + " bytes pending)");
        }
        log_to(logger_, AsyncLogger::INFO, "Server closed the stream");
    }

    Transport& transport_;
    StreamOptions opts_;
    AsyncLogger* logger_;
    IdleCounter idle_;
    std::string buffer_;
    size_t consumed_ = 0;
    size_t last_rejected_offset_ = static_cast<size_t>(-1);
    bool finished_ = false;
    simdjson::dom::parser parser_;
};

// =============================================================================
// RAW (AVRO) STREAM DECODER
// =============================================================================
// Lazy, unbounded and non-restartable sequence of opaque byte chunks, each
// exactly as one receive returned it. Polls without blocking and pauses
// poll_delay after every empty poll, so one iteration never blocks for longer
// than a single delay. Same idle limit and cancellation as the JSON decoder;
// chunks carry no record boundaries, so a server close always ends cleanly.
// =============================================================================
class RawStreamDecoder {
public:
    RawStreamDecoder(Transport& transport, StreamOptions options, AsyncLogger* logger = nullptr)
        : transport_(transport), opts_(std::move(options)), logger_(logger), idle_(opts_.max_idle_reads) {}

    RawStreamDecoder(const RawStreamDecoder&) = delete;
    RawStreamDecoder& operator=(const RawStreamDecoder&) = delete;

    std::optional<std::string> next() {
        if (finished_) return std::nullopt;

        while (detail::keep_running(opts_)) {
            RecvResult r = transport_.receive(opts_.recv_buffer_bytes, RecvMode::NonBlocking);
            if (r.status == RecvStatus::Data) {
                idle_.reset();
                consumed_ += r.bytes.size();
                return std::move(r.bytes);
            }
            if (r.status == RecvStatus::Closed) {
                finished_ = true;
                log_to(logger_, AsyncLogger::INFO, "Server closed the stream");
                return std::nullopt;
            }
            if (!detail::keep_running(opts_)) break;
            if (idle_.record_empty()) {
                finished_ = true;
                throw detail::idle_exhausted(idle_);
            }
            log_to(logger_, AsyncLogger::DEBUG, "No data, retrying in " + std::to_string(opts_.poll_delay.count())
                                                + "ms (" + std::to_string(idle_.count()) + "/"
                                                + std::to_string(idle_.limit()) + ")");
            pause();
        }
        finished_ = true;
        return std::nullopt;
    }

    size_t consumed_bytes() const { return consumed_; }
    int idle_reads() const { return idle_.count(); }
    bool finished() const { return finished_; }

private:
    void pause() {
        if (opts_.sleep) { opts_.sleep(opts_.poll_delay); return; }

        // Sleep in short slices so cancellation is noticed promptly.
        auto deadline = std::chrono::steady_clock::now() + opts_.poll_delay;
        while (detail::keep_running(opts_)) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) break;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                deadline - now, std::chrono::milliseconds(100)));
        }
    }

    Transport& transport_;
    StreamOptions opts_;
    AsyncLogger* logger_;
    IdleCounter idle_;
    size_t consumed_ = 0;
    bool finished_ = false;
};

#endif
