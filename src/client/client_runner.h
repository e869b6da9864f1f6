#ifndef CLIENT_RUNNER_H
#define CLIENT_RUNNER_H

#include <chrono>
#include <ostream>
#include <string>

#include "client_protocol.h"
#include "cdc_errors.h"
#include "cdc_session.h"
#include "stream_decoder.h"
#include "transport.h"

// =============================================================================
// EXIT CODES
// =============================================================================
enum ExitCode {
    EXIT_STREAM_ENDED  = 0,
    EXIT_IDLE_TIMEOUT  = 1,
    EXIT_USAGE         = 2,
    EXIT_CONNECTION    = 3,
    EXIT_IO            = 4,
    EXIT_MALFORMED     = 5,
};

// =============================================================================
// OUTPUT LOOPS
// =============================================================================
// JSON: one minified record per line. AVRO: bytes forwarded verbatim.
// =============================================================================
inline size_t print_json_stream(Transport& transport, const StreamOptions& opts,
                                std::ostream& out, AsyncLogger* logger) {
    JsonStreamDecoder decoder(transport, opts, logger);
    size_t records = 0;
    while (auto record = decoder.next()) {
        out << record->json << "\n";
        out.flush();
        records++;
    }
    log_to(logger, AsyncLogger::INFO, "JSON stream ended after " + std::to_string(records) + " records ("
                                      + std::to_string(decoder.consumed_bytes()) + " bytes)");
    return records;
}

inline size_t forward_raw_stream(Transport& transport, const StreamOptions& opts,
                                 std::ostream& out, AsyncLogger* logger) {
    RawStreamDecoder decoder(transport, opts, logger);
    size_t chunks = 0;
    while (auto chunk = decoder.next()) {
        out.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));
        out.flush();
        chunks++;
    }
    log_to(logger, AsyncLogger::INFO, "AVRO stream ended after " + std::to_string(chunks) + " chunks ("
                                      + std::to_string(decoder.consumed_bytes()) + " bytes)");
    return chunks;
}

// =============================================================================
// SESSION
// =============================================================================
// Connect, handshake, stream to `out`. Returns the process exit code. The
// socket belongs to the session and is released on every path out, including
// the fatal ones.
// =============================================================================
inline int run_session(const SessionConfig& conf, const StreamOptions& opts,
                       std::ostream& out, AsyncLogger* logger = nullptr) {
    try {
        log_to(logger, AsyncLogger::INFO, "Connecting to " + conf.host + ":" + std::to_string(conf.port));
        auto transport = TcpTransport::connect(conf.host, conf.port,
                                               std::chrono::milliseconds(conf.connect_timeout_ms), logger);
        const std::string peer = transport->peer();

        CdcSession session(std::move(transport), conf, logger);
        session.run_handshake();
        log_to(logger, AsyncLogger::INFO, "Streaming " + conf.object + " from " + peer);

        if (conf.format == StreamFormat::JSON) print_json_stream(session.transport(), opts, out, logger);
        else forward_raw_stream(session.transport(), opts, out, logger);

        if (!detail::keep_running(opts)) log_to(logger, AsyncLogger::INFO, "Interrupted, closing connection.");
        return EXIT_STREAM_ENDED;
    }
    catch (const FramingExhaustion& e) {
        log_to(logger, AsyncLogger::ERROR_LOG, std::string("Giving up: ") + e.what());
        return EXIT_IDLE_TIMEOUT;
    }
    catch (const ConnectionError& e) {
        log_to(logger, AsyncLogger::ERROR_LOG, std::string("Connection failed: ") + e.what());
        return EXIT_CONNECTION;
    }
    catch (const MalformedRecord& e) {
        log_to(logger, AsyncLogger::ERROR_LOG, e.what());
        return EXIT_MALFORMED;
    }
    catch (const ConfigurationError& e) {
        log_to(logger, AsyncLogger::ERROR_LOG, std::string("Configuration error: ") + e.what());
        return EXIT_USAGE;
    }
    catch (const CdcError& e) {
        log_to(logger, AsyncLogger::ERROR_LOG, std::string("I/O error: ") + e.what());
        return EXIT_IO;
    }
    catch (const std::exception& e) {
        log_to(logger, AsyncLogger::ERROR_LOG, std::string("Unexpected error: ") + e.what());
        return EXIT_IO;
    }
}

#endif
