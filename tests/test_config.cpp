#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "client_protocol.h"
#include "cdc_session.h"
#include "stream_decoder.h"
#include "common/test_check.hpp"

static CliArgs parse(std::vector<std::string> args) {
    args.insert(args.begin(), "cdc_client");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_client_cli(static_cast<int>(argv.size()), argv.data());
}

static AppConfig config_with(const std::map<std::string, std::string>& kv) {
    AppConfig conf;
    for (const auto& [k, v] : kv) conf.set(k, v);
    return conf;
}

// -----------------------------------------------------------------------------
// Test: CLI flags map onto config keys, defaults stay untouched
// -----------------------------------------------------------------------------
void test_cli_flags() {
    std::cout << "[TEST] parse_client_cli flags\n";

    CliArgs cli = parse({"--host", "db1", "-P", "4002", "-u", "massi", "-p", "secret", "-f", "AVRO", "shop.orders.000001"});
    TEST_CHECK(cli.ok());
    TEST_CHECK(cli.overrides.at("host") == "db1");
    TEST_CHECK(cli.overrides.at("port") == "4002");
    TEST_CHECK(cli.overrides.at("user") == "massi");
    TEST_CHECK(cli.overrides.at("password") == "secret");
    TEST_CHECK(cli.overrides.at("format") == "AVRO");
    TEST_CHECK(cli.overrides.at("object") == "shop.orders.000001");
    TEST_CHECK(cli.config_path == CONFIG_FILE_NAME);

    CliArgs long_form = parse({"--port=4100", "--user=u", "-s", "max_idle_reads=9", "-c", "/etc/cdc.conf", "a.b"});
    TEST_CHECK(long_form.ok());
    TEST_CHECK(long_form.overrides.at("port") == "4100");
    TEST_CHECK(long_form.overrides.at("user") == "u");
    TEST_CHECK(long_form.overrides.at("max_idle_reads") == "9");
    TEST_CHECK(long_form.config_path == "/etc/cdc.conf");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: CLI usage errors
// -----------------------------------------------------------------------------
void test_cli_errors() {
    std::cout << "[TEST] parse_client_cli errors\n";

    TEST_CHECK(!parse({}).ok());                          // FILE is required
    TEST_CHECK(!parse({"a.b", "c.d"}).ok());              // one FILE only
    TEST_CHECK(!parse({"--port"}).ok());                  // missing value
    TEST_CHECK(!parse({"--bogus", "a.b"}).ok());
    TEST_CHECK(!parse({"-s", "novalue", "a.b"}).ok());

    CliArgs help = parse({"-h"});
    TEST_CHECK(help.ok() && help.show_help);
    CliArgs version = parse({"--version"});
    TEST_CHECK(version.ok() && version.show_version);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: config file parsing, comments and CLI precedence
// -----------------------------------------------------------------------------
void test_load_config_file() {
    std::cout << "[TEST] load_config + overrides\n";

    fs::path path = fs::temp_directory_path() / "cdc_client_test.conf";
    {
        std::ofstream out(path);
        out << "# CDC client\n"
            << "host = cdc.example.com\n"
            << "port=4009   # trailing comment\n"
            << "\n"
            << "format = avro\n"
            << "garbage line without separator\n";
    }

    AppConfig conf = load_config(path);
    TEST_CHECK(conf.get("host", "") == "cdc.example.com");
    TEST_CHECK(conf.get_int("port", 0) == 4009);
    TEST_CHECK(conf.get("format", "") == "avro");
    TEST_CHECK(!conf.has("garbage line without separator"));

    CliArgs cli = parse({"-P", "5000", "db.tbl"});
    cli.apply_overrides(conf);
    TEST_CHECK(conf.get_int("port", 0) == 5000);

    SessionConfig session = make_session_config(conf);
    TEST_CHECK(session.host == "cdc.example.com");
    TEST_CHECK(session.port == 5000);
    TEST_CHECK(session.format == StreamFormat::AVRO);
    TEST_CHECK(session.object == "db.tbl");

    fs::remove(path);

    AppConfig missing = load_config(fs::temp_directory_path() / "does_not_exist_cdc.conf");
    TEST_CHECK(missing.data.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: defaults
// -----------------------------------------------------------------------------
void test_session_defaults() {
    std::cout << "[TEST] make_session_config defaults\n";

    SessionConfig c = make_session_config(config_with({{"object", "test.t1"}}));
    TEST_CHECK(c.host == "localhost");
    TEST_CHECK(c.port == 4001);
    TEST_CHECK(c.user.empty());
    TEST_CHECK(c.password.empty());
    TEST_CHECK(c.format == StreamFormat::JSON);
    TEST_CHECK(c.client_uuid == DEFAULT_CLIENT_UUID);

    StreamOptions o = make_stream_options(AppConfig{});
    TEST_CHECK(o.max_idle_reads == 5);
    TEST_CHECK(o.recv_buffer_bytes == 1024);
    TEST_CHECK(o.poll_delay == std::chrono::milliseconds(1000));
    TEST_CHECK(o.invalid_json == InvalidJsonPolicy::Fail);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: configuration errors are raised before any network activity
// -----------------------------------------------------------------------------
void test_configuration_errors() {
    std::cout << "[TEST] configuration validation\n";

    TEST_CHECK(parse_stream_format("json") == StreamFormat::JSON);
    TEST_CHECK(parse_stream_format("Avro") == StreamFormat::AVRO);
    TEST_CHECK_THROWS(parse_stream_format("XML"), ConfigurationError);

    TEST_CHECK(is_valid_object_id("db.table"));
    TEST_CHECK(is_valid_object_id("db.table.000001"));
    TEST_CHECK(!is_valid_object_id(""));
    TEST_CHECK(!is_valid_object_id("table"));
    TEST_CHECK(!is_valid_object_id("db..t"));
    TEST_CHECK(!is_valid_object_id("db.t."));
    TEST_CHECK(!is_valid_object_id("db.t.v1"));
    TEST_CHECK(!is_valid_object_id("a.b.1.2"));
    TEST_CHECK(!is_valid_object_id("db.my table"));

    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"format", "csv"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "nodot"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"port", "0"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"port", "70000"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"port", "40x1"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"host", ""}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"client_uuid", "a,b"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"client_uuid", std::string(33, 'x')}})), ConfigurationError);
    TEST_CHECK_THROWS(make_session_config(config_with({{"object", "db.t"}, {"user", std::string(129, 'u')}})), ConfigurationError);

    TEST_CHECK_THROWS(make_stream_options(config_with({{"max_idle_reads", "0"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_stream_options(config_with({{"recv_buffer_bytes", "-1"}})), ConfigurationError);
    TEST_CHECK_THROWS(make_stream_options(config_with({{"invalid_json", "ignore"}})), ConfigurationError);
    TEST_CHECK(make_stream_options(config_with({{"invalid_json", "RETRY"}})).invalid_json == InvalidJsonPolicy::Retry);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: case folding leaves non-ASCII bytes alone
// -----------------------------------------------------------------------------
void test_case_folding() {
    std::cout << "[TEST] ASCII case folding\n";

    TEST_CHECK(to_lower_ascii("DeBuG") == "debug");
    TEST_CHECK(to_upper_ascii("avro") == "AVRO");
    TEST_CHECK(to_lower_ascii("W\xc3\x96RN\xff") == "w\xc3\x96rn\xff");
    TEST_CHECK(to_upper_ascii("js\xc3\xb6n") == "JS\xc3\xb6N");

    TEST_CHECK_THROWS(parse_stream_format("JS\xc3\x96N"), ConfigurationError);
    TEST_CHECK_THROWS(parse_invalid_json_policy("f\xe4il"), ConfigurationError);
    TEST_CHECK(AsyncLogger::parse_level("\xff\xfe") == AsyncLogger::INFO);
    TEST_CHECK(AsyncLogger::parse_level("WARNING") == AsyncLogger::WARN);
    TEST_CHECK(config_with({{"log_console", "\xc3\x84"}}).get_bool("log_console", true));
    TEST_CHECK(!config_with({{"log_console", "No"}}).get_bool("log_console", true));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: wire command text
// -----------------------------------------------------------------------------
void test_wire_commands() {
    std::cout << "[TEST] wire commands\n";

    TEST_CHECK(build_register_command("XXX-YYY_YYY", StreamFormat::JSON) == "REGISTER UUID=XXX-YYY_YYY, TYPE=JSON");
    TEST_CHECK(build_register_command("abc", StreamFormat::AVRO) == "REGISTER UUID=abc, TYPE=AVRO");
    TEST_CHECK(build_request_data_command("shop.orders.000002") == "REQUEST-DATA shop.orders.000002");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_cli_flags();
    test_cli_errors();
    test_load_config_file();
    test_session_defaults();
    test_configuration_errors();
    test_case_folding();
    test_wire_commands();

    std::cout << "\n[ALL CONFIGURATION TESTS PASSED]\n";
    return 0;
}
