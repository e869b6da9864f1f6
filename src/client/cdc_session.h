#ifndef CDC_SESSION_H
#define CDC_SESSION_H

#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "client_protocol.h"
#include "cdc_errors.h"
#include "crypto_utils.h"
#include "transport.h"

// =============================================================================
// STREAM FORMAT
// =============================================================================
enum class StreamFormat { JSON, AVRO };

inline const char* to_string(StreamFormat f) {
    return f == StreamFormat::AVRO ? "AVRO" : "JSON";
}

// Case-insensitive; throws ConfigurationError for anything but JSON/AVRO.
inline StreamFormat parse_stream_format(const std::string& name) {
    std::string v = to_upper_ascii(name);
    if (v == "JSON") return StreamFormat::JSON;
    if (v == "AVRO") return StreamFormat::AVRO;
    throw ConfigurationError("invalid format '" + name + "', expected JSON or AVRO");
}

// =============================================================================
// SESSION CONFIGURATION
// =============================================================================
// Immutable once the handshake begins.
// =============================================================================
struct SessionConfig {
    std::string  host = DEFAULT_HOST;
    int          port = DEFAULT_PORT;
    std::string  user;
    std::string  password;
    std::string  object;                       // DATABASE.TABLE[.VERSION]
    StreamFormat format = StreamFormat::JSON;
    std::string  client_uuid = DEFAULT_CLIENT_UUID;
    int          connect_timeout_ms   = DEFAULT_CONNECT_TIMEOUT_MS;
    int          handshake_timeout_ms = DEFAULT_HANDSHAKE_TIMEOUT_MS;
};

inline bool is_valid_object_id(const std::string& id) {
    std::vector<std::string> parts;
    std::string part;
    for (char c : id) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
        if (c == '.') { parts.push_back(part); part.clear(); }
        else part += c;
    }
    parts.push_back(part);

    if (parts.size() < 2 || parts.size() > 3) return false;
    for (const auto& p : parts) {
        if (p.empty()) return false;
    }
    if (parts.size() == 3) {
        for (char c : parts[2]) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
    }
    return true;
}

inline void validate_session_config(const SessionConfig& c) {
    if (c.host.empty()) throw ConfigurationError("host must not be empty");
    if (c.port < 1 || c.port > 65535) throw ConfigurationError("port out of range: " + std::to_string(c.port));
    if (!is_valid_object_id(c.object))
        throw ConfigurationError("invalid object identifier '" + c.object + "', expected DATABASE.TABLE[.VERSION]");
    if (c.user.size() > CDC_USER_MAXLEN)
        throw ConfigurationError("user name longer than " + std::to_string(CDC_USER_MAXLEN) + " bytes");
    if (c.client_uuid.empty() || c.client_uuid.size() > CDC_UUID_MAXLEN)
        throw ConfigurationError("client_uuid must be 1.." + std::to_string(CDC_UUID_MAXLEN) + " bytes");
    for (char ch : c.client_uuid) {
        if (ch == ',' || std::isspace(static_cast<unsigned char>(ch)))
            throw ConfigurationError("client_uuid must not contain ',' or whitespace");
    }
    if (c.connect_timeout_ms <= 0) throw ConfigurationError("connect_timeout_ms must be positive");
    if (c.handshake_timeout_ms <= 0) throw ConfigurationError("handshake_timeout_ms must be positive");
}

// Strict integer read: a present but malformed value is an error, not a default.
inline int require_int(const AppConfig& conf, const std::string& key, int def) {
    if (!conf.has(key)) return def;
    const std::string v = conf.get(key, "");
    try {
        size_t pos = 0;
        int n = std::stoi(v, &pos);
        if (pos == v.size()) return n;
    } catch (const std::exception&) {
    }
    throw ConfigurationError("invalid integer for " + key + ": '" + v + "'");
}

inline SessionConfig make_session_config(const AppConfig& conf) {
    SessionConfig c;
    c.host        = conf.get("host", DEFAULT_HOST);
    c.port        = require_int(conf, "port", DEFAULT_PORT);
    c.user        = conf.get("user", "");
    c.password    = conf.get("password", "");
    c.object      = conf.get("object", "");
    c.format      = parse_stream_format(conf.get("format", "JSON"));
    c.client_uuid = conf.get("client_uuid", DEFAULT_CLIENT_UUID);
    c.connect_timeout_ms   = require_int(conf, "connect_timeout_ms", DEFAULT_CONNECT_TIMEOUT_MS);
    c.handshake_timeout_ms = require_int(conf, "handshake_timeout_ms", DEFAULT_HANDSHAKE_TIMEOUT_MS);
    validate_session_config(c);
    return c;
}

// =============================================================================
// WIRE COMMANDS
// =============================================================================
// ASCII, sent as raw bytes with no terminator or length prefix.
// =============================================================================
inline std::string build_register_command(const std::string& client_uuid, StreamFormat format) {
    return "REGISTER UUID=" + client_uuid + ", TYPE=" + to_string(format);
}

inline std::string build_request_data_command(const std::string& object) {
    return "REQUEST-DATA " + object;
}

// =============================================================================
// SESSION + HANDSHAKE SEQUENCER
// =============================================================================
// Connected -> Authenticated -> Registered -> Streaming -> Closed
//
// Replies to AUTH and REGISTER are read once and discarded. They are never
// checked for success: data, "ERR ..." text, or no reply before the handshake
// timeout all move the session forward. The server starts streaming right
// after REQUEST-DATA, so no reply is read for that step.
//
// Any I/O failure during the handshake closes the session and propagates.
// =============================================================================
enum class SessionState { Connected, Authenticated, Registered, Streaming, Closed };

inline const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Connected:     return "Connected";
        case SessionState::Authenticated: return "Authenticated";
        case SessionState::Registered:    return "Registered";
        case SessionState::Streaming:     return "Streaming";
        default:                          return "Closed";
    }
}

class CdcSession {
public:
    CdcSession(std::unique_ptr<Transport> transport, SessionConfig config, AsyncLogger* logger = nullptr)
        : transport_(std::move(transport)), config_(std::move(config)), logger_(logger) {
        if (!transport_ || !transport_->is_open()) throw std::invalid_argument("CdcSession needs an open transport");
        validate_session_config(config_);
    }

    ~CdcSession() { close(); }
    CdcSession(const CdcSession&) = delete;
    CdcSession& operator=(const CdcSession&) = delete;

    void authenticate() {
        expect_state(SessionState::Connected, "AUTH");
        guarded("AUTH", [&] {
            transport_->send(encode_credentials(config_.user, config_.password));
            discard_reply("AUTH");
        });
        state_ = SessionState::Authenticated;
        log_to(logger_, AsyncLogger::INFO, "Authentication sent for user '" + config_.user + "'");
    }

    void register_client() {
        expect_state(SessionState::Authenticated, "REGISTER");
        guarded("REGISTER", [&] {
            transport_->send(build_register_command(config_.client_uuid, config_.format));
            discard_reply("REGISTER");
        });
        state_ = SessionState::Registered;
        log_to(logger_, AsyncLogger::INFO, std::string("Registered as ") + config_.client_uuid
                                             + " (" + to_string(config_.format) + ")");
    }

    void request_data() {
        expect_state(SessionState::Registered, "REQUEST-DATA");
        guarded("REQUEST-DATA", [&] { transport_->send(build_request_data_command(config_.object)); });
        state_ = SessionState::Streaming;
        log_to(logger_, AsyncLogger::INFO, "Requested data for " + config_.object);
    }

    void run_handshake() {
        authenticate();
        register_client();
        request_data();
    }

    void close() {
        if (transport_) transport_->close();
        state_ = SessionState::Closed;
    }

    SessionState state() const { return state_; }
    Transport& transport() { return *transport_; }

private:
    void expect_state(SessionState expected, const char* step) const {
        if (state_ != expected) {
            throw std::logic_error(std::string(step) + " requires state " + to_string(expected)
                                   + ", session is " + to_string(state_));
        }
    }

    template <typename Fn>
    void guarded(const char* step, Fn&& fn) {
        try {
            fn();
        } catch (const IOError& e) {
            log_to(logger_, AsyncLogger::ERROR_LOG, std::string(step) + " failed: " + e.what());
            close();
            throw;
        }
    }

    void discard_reply(const char* step) {
        RecvResult reply = transport_->receive(DEFAULT_RECV_BUFFER_BYTES, RecvMode::Blocking,
                                               std::chrono::milliseconds(config_.handshake_timeout_ms));
        switch (reply.status) {
            case RecvStatus::Closed:
                throw IOError(std::string("connection closed by server during ") + step);
            case RecvStatus::Empty:
                log_to(logger_, AsyncLogger::DEBUG, std::string("No reply to ") + step + " within "
                                                    + std::to_string(config_.handshake_timeout_ms) + "ms, proceeding");
                break;
            case RecvStatus::Data:
                if (reply.bytes.rfind("ERR", 0) == 0) {
                    log_to(logger_, AsyncLogger::WARN, std::string("Server answered ") + step + " with '"
                                                       + printable(reply.bytes) + "', proceeding");
                } else {
                    log_to(logger_, AsyncLogger::DEBUG, std::string("Reply to ") + step + ": " + printable(reply.bytes));
                }
                break;
        }
    }

    static std::string printable(const std::string& bytes, size_t max_len = 80) {
        std::string out;
        for (size_t i = 0; i < bytes.size() && i < max_len; i++) {
            unsigned char c = static_cast<unsigned char>(bytes[i]);
            out += std::isprint(c) ? static_cast<char>(c) : '.';
        }
        if (bytes.size() > max_len) out += "...";
        return out;
    }

    std::unique_ptr<Transport> transport_;
    SessionConfig config_;
    AsyncLogger* logger_;
    SessionState state_ = SessionState::Connected;
};

#endif
