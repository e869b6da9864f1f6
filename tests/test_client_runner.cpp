#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "client_runner.h"
#include "common/loopback_server.hpp"
#include "common/test_check.hpp"

using namespace std::chrono;

static SessionConfig base_config(int port, StreamFormat format = StreamFormat::JSON) {
    SessionConfig conf;
    conf.host = "127.0.0.1";
    conf.port = port;
    conf.user = "cdcuser";
    conf.password = "cdc pass";
    conf.object = "shop.orders";
    conf.format = format;
    conf.connect_timeout_ms = 1000;
    conf.handshake_timeout_ms = 2000;
    return conf;
}

static StreamOptions stream_options() {
    StreamOptions o;
    o.read_timeout = milliseconds(2000);
    o.poll_delay = milliseconds(10);
    o.max_idle_reads = 5;
    return o;
}

// Runs one session against a server that completes the handshake, sends
// `payload` and closes.
static int run_against(const std::string& payload, std::string& output,
                       StreamFormat format = StreamFormat::JSON, StreamOptions opts = stream_options()) {
    Listener listener;
    SessionConfig conf = base_config(listener.port, format);

    std::thread server([&] {
        int c = listener.accept_one();
        if (c < 0) return;
        if (serve_handshake(c, conf)) write_all(c, payload);
        ::close(c);
    });

    std::ostringstream out;
    int rc = run_session(conf, opts, out);
    server.join();
    output = out.str();
    return rc;
}

// -----------------------------------------------------------------------------
// Test: clean end of stream
// -----------------------------------------------------------------------------
void test_stream_ended() {
    std::cout << "[TEST] stream ended -> exit 0\n";

    std::string output;
    int rc = run_against("{\"id\": 1}\n{\"id\": 2}\n", output);
    TEST_CHECK(rc == EXIT_STREAM_ENDED);
    TEST_CHECK(output == "{\"id\":1}\n{\"id\":2}\n");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: AVRO bytes are forwarded verbatim
// -----------------------------------------------------------------------------
void test_raw_forwarding() {
    std::cout << "[TEST] AVRO forwarding -> exit 0\n";

    StreamOptions opts = stream_options();
    opts.max_idle_reads = 200;      // tolerate polls before the bytes land

    const std::string avro("Obj\x01\x00\x02\xff", 7);
    std::string output;
    int rc = run_against(avro, output, StreamFormat::AVRO, opts);
    TEST_CHECK(rc == EXIT_STREAM_ENDED);
    TEST_CHECK(output == avro);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: silent server exhausts the idle limit
// -----------------------------------------------------------------------------
void test_idle_timeout() {
    std::cout << "[TEST] idle server -> exit 1\n";

    Listener listener;
    SessionConfig conf = base_config(listener.port);
    std::promise<void> done;
    std::future<void> done_signal = done.get_future();

    std::thread server([&] {
        int c = listener.accept_one();
        if (c < 0) return;
        if (serve_handshake(c, conf)) write_all(c, "{\"id\":1}");
        done_signal.wait();
        ::close(c);
    });

    StreamOptions opts = stream_options();
    opts.read_timeout = milliseconds(20);

    std::ostringstream out;
    auto start = steady_clock::now();
    int rc = run_session(conf, opts, out);
    auto elapsed = steady_clock::now() - start;
    done.set_value();
    server.join();

    TEST_CHECK(rc == EXIT_IDLE_TIMEOUT);
    TEST_CHECK(out.str() == "{\"id\":1}\n");
    TEST_CHECK(elapsed >= milliseconds(90));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: error mapping
// -----------------------------------------------------------------------------
void test_error_exit_codes() {
    std::cout << "[TEST] error exit codes\n";

    std::string output;

    // Close inside a record.
    TEST_CHECK(run_against("{\"id\":1}{\"id\":", output) == EXIT_IO);
    TEST_CHECK(output == "{\"id\":1}\n");

    // Complete but not JSON.
    TEST_CHECK(run_against("{\"id\" 1}", output) == EXIT_MALFORMED);
    TEST_CHECK(output.empty());

    // Nobody listening.
    int port = 0;
    {
        Listener gone;
        port = gone.port;
    }
    std::ostringstream out;
    TEST_CHECK(run_session(base_config(port), stream_options(), out) == EXIT_CONNECTION);

    // Rejected by the session before any command is sent.
    Listener listener;
    SessionConfig bad = base_config(listener.port);
    bad.object = "no_table";
    std::string first_bytes = "unset";
    std::thread server([&] {
        int c = listener.accept_one();
        if (c < 0) return;
        first_bytes = read_exact(c, 1);
        ::close(c);
    });
    TEST_CHECK(run_session(bad, stream_options(), out) == EXIT_USAGE);
    server.join();
    TEST_CHECK(first_bytes.empty());

    std::cout << "[TEST] OK\n";
}

int main() {
    test_stream_ended();
    test_raw_forwarding();
    test_idle_timeout();
    test_error_exit_codes();

    std::cout << "\n[ALL CLIENT RUNNER TESTS PASSED]\n";
    return 0;
}
