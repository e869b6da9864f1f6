#ifndef CLIENT_PROTOCOL_H
#define CLIENT_PROTOCOL_H

#define _CRT_SECURE_NO_WARNINGS
#if defined(_MSC_VER) && !defined(_WIN32)
#define _WIN32
#endif

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <algorithm>
#include <string>
#include <fstream>
#include <map>
#include <filesystem>
#include <vector>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <iostream>
#include <sstream>
#include <iomanip>

namespace fs = std::filesystem;

// =============================================================================
// CONSTANTS
// =============================================================================
constexpr int DEFAULT_PORT = 4001;
constexpr int DEFAULT_CONNECT_TIMEOUT_MS   = 5000;
constexpr int DEFAULT_HANDSHAKE_TIMEOUT_MS = 5000;
constexpr int DEFAULT_READ_TIMEOUT_MS      = 5000;
constexpr int DEFAULT_POLL_DELAY_MS        = 1000;
constexpr int DEFAULT_MAX_IDLE_READS       = 5;
constexpr size_t DEFAULT_RECV_BUFFER_BYTES = 1024;

// Server-side field limits (registration UUID, user name)
constexpr size_t CDC_UUID_MAXLEN = 32;
constexpr size_t CDC_USER_MAXLEN = 128;

const std::string DEFAULT_HOST        = "localhost";
const std::string DEFAULT_CLIENT_UUID = "XXX-YYY_YYY";
const std::string CONFIG_FILE_NAME    = "cdc_client.conf";
const std::string CLIENT_VERSION      = "1.0.0";

// =============================================================================
// STRING HELPERS
// =============================================================================
// ASCII case folding; other bytes (UTF-8 included) pass through unchanged.
inline std::string to_lower_ascii(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

inline std::string to_upper_ascii(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return v;
}

// =============================================================================
// CONFIGURATION MANAGEMENT
// =============================================================================
struct AppConfig {
    std::map<std::string, std::string> data;

    std::string get(const std::string& key, const std::string& def) const {
        return data.count(key) ? data.at(key) : def;
    }
    int get_int(const std::string& key, int def) const {
        try { return data.count(key) ? std::stoi(data.at(key)) : def; }
        catch (const std::exception&) { return def; }
    }
    size_t get_size(const std::string& key, size_t def) const {
        try { return data.count(key) ? std::stoull(data.at(key)) : def; }
        catch (const std::exception&) { return def; }
    }
    bool get_bool(const std::string& key, bool def) const {
        if (!data.count(key)) return def;
        std::string v = to_lower_ascii(data.at(key));
        if (v == "true" || v == "1" || v == "yes") return true;
        if (v == "false" || v == "0" || v == "no") return false;
        return def;
    }
    bool has(const std::string& key) const { return data.count(key) != 0; }
    void set(const std::string& key, const std::string& val) { data[key] = val; }
};

inline AppConfig load_config(const fs::path& config_path) {
    AppConfig config;
    std::ifstream file(config_path);
    if (!file.is_open()) return config;
    std::string line;
    while (std::getline(file, line)) {
        size_t comment = line.find('#');
        if (comment != std::string::npos) line = line.substr(0, comment);
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);
        if (line.empty()) continue;
        size_t sep = line.find('=');
        if (sep != std::string::npos) {
            std::string key = line.substr(0, sep);
            std::string val = line.substr(sep + 1);
            key.erase(key.find_last_not_of(" \t") + 1);
            val.erase(0, val.find_first_not_of(" \t"));
            config.data[key] = val;
        }
    }
    return config;
}

// =============================================================================
// CLI ARGUMENT PARSING
// =============================================================================
// Command-line values are collected as config overrides so that a value given
// on the command line always wins over the config file.
// =============================================================================
struct CliArgs {
    std::string config_path;
    std::map<std::string, std::string> overrides;
    bool show_help = false;
    bool show_version = false;
    std::string error;

    bool ok() const { return error.empty(); }
    void apply_overrides(AppConfig& conf) const {
        for (const auto& [k, v] : overrides) conf.set(k, v);
    }
};

inline void print_client_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [OPTIONS] FILE\n"
              << "\nStream change data for FILE (DATABASE.TABLE[.VERSION]) from a CDC server.\n"
              << "\nOptions:\n"
              << "      --host <host>          Server host (default: localhost)\n"
              << "  -P, --port <port>          Server port (default: 4001)\n"
              << "  -u, --user <user>          User name (default: empty)\n"
              << "  -p, --password <password>  Password (default: empty)\n"
              << "  -f, --format <JSON|AVRO>   Stream format (default: JSON)\n"
              << "  -c, --config <path>        Path to cdc_client.conf (default: ./cdc_client.conf)\n"
              << "  -s, --set <key=value>      Override a config value (repeatable)\n"
              << "  -h, --help                 Show this help message\n"
              << "  -v, --version              Show version\n"
              << "\nStreaming:\n"
              << "  read_timeout_ms            JSON receive timeout, 0 blocks (default: 5000)\n"
              << "  poll_delay_ms              AVRO poll delay between empty reads (default: 1000)\n"
              << "  max_idle_reads             Consecutive empty reads before giving up (default: 5)\n"
              << "  invalid_json               fail | retry (default: fail)\n";
}

inline CliArgs parse_client_cli(int argc, char* argv[]) {
    static const std::map<std::string, std::string> value_flags = {
        {"--host", "host"},
        {"-P", "port"},     {"--port", "port"},
        {"-u", "user"},     {"--user", "user"},
        {"-p", "password"}, {"--password", "password"},
        {"-f", "format"},   {"--format", "format"},
    };

    CliArgs args;
    args.config_path = CONFIG_FILE_NAME;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        std::string inline_value;
        bool has_inline = false;
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        auto take_value = [&](std::string& out) -> bool {
            if (has_inline) { out = inline_value; return true; }
            if (i + 1 >= argc) { args.error = "missing value for " + arg; return false; }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") { args.show_help = true; }
        else if (arg == "-v" || arg == "--version") { args.show_version = true; }
        else if (arg == "-c" || arg == "--config") {
            if (!take_value(args.config_path)) return args;
        }
        else if (arg == "-s" || arg == "--set") {
            std::string kv;
            if (!take_value(kv)) return args;
            size_t eq = kv.find('=');
            if (eq == std::string::npos) { args.error = "expected key=value after " + arg; return args; }
            args.overrides[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        else if (value_flags.count(arg)) {
            std::string value;
            if (!take_value(value)) return args;
            args.overrides[value_flags.at(arg)] = value;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            args.error = "unknown argument: " + arg;
            return args;
        }
        else { positional.push_back(arg); }
    }

    if (args.show_help || args.show_version) return args;

    if (positional.size() > 1) {
        args.error = "unexpected argument: " + positional[1];
    } else if (positional.size() == 1) {
        args.overrides["object"] = positional[0];
    } else if (!args.overrides.count("object")) {
        args.error = "the FILE argument is required";
    }
    return args;
}

// =============================================================================
// ASYNC LOGGER WITH LOG ROTATION
// =============================================================================
// Console echo goes to stderr; stdout carries the decoded stream.
// =============================================================================
class AsyncLogger {
public:
    enum Level { DEBUG, INFO, WARN, ERROR_LOG };

    static Level parse_level(const std::string& name, Level def = INFO) {
        std::string v = to_lower_ascii(name);
        if (v == "debug") return DEBUG;
        if (v == "info") return INFO;
        if (v == "warn" || v == "warning") return WARN;
        if (v == "error") return ERROR_LOG;
        return def;
    }
private:
    struct LogEntry { Level level; std::string message; std::chrono::system_clock::time_point timestamp; };
    std::queue<LogEntry> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    size_t in_flight_ = 0;
    std::atomic<bool> running_{true};
    std::thread worker_;
    std::ofstream log_file_;
    std::string base_filename_;
    size_t max_file_size_, current_file_size_;
    int max_rotated_files_;
    bool echo_to_console_;
    Level min_level_;

    static const char* level_str(Level l) {
        switch (l) { case WARN: return "[WARN] "; case ERROR_LOG: return "[ERROR] "; case DEBUG: return "[DEBUG] "; default: return "[INFO] "; }
    }
    std::string format_entry(const LogEntry& entry) {
        std::time_t t = std::chrono::system_clock::to_time_t(entry.timestamp);
        std::stringstream ss;
        ss << "[" << std::put_time(std::localtime(&t), "%Y-%m-%d %H:%M:%S") << "] " << level_str(entry.level) << entry.message;
        return ss.str();
    }
    void rotate_logs() {
        log_file_.close();
        std::remove((base_filename_ + "." + std::to_string(max_rotated_files_)).c_str());
        for (int i = max_rotated_files_ - 1; i >= 1; i--)
            std::rename((base_filename_ + "." + std::to_string(i)).c_str(), (base_filename_ + "." + std::to_string(i + 1)).c_str());
        std::rename(base_filename_.c_str(), (base_filename_ + ".1").c_str());
        log_file_.open(base_filename_, std::ios::app);
        current_file_size_ = 0;
    }
    void worker_loop() {
        while (true) {
            std::queue<LogEntry> batch;
            { std::unique_lock<std::mutex> lock(queue_mutex_); cv_.wait(lock, [this] { return !queue_.empty() || !running_; }); if (!running_ && queue_.empty()) return; std::swap(batch, queue_); }
            size_t written = batch.size();
            while (!batch.empty()) {
                std::string formatted = format_entry(batch.front()); batch.pop();
                if (echo_to_console_) std::cerr << formatted << "\n";
                if (log_file_.is_open()) { log_file_ << formatted << "\n"; log_file_.flush(); current_file_size_ += formatted.size() + 1; if (current_file_size_ >= max_file_size_) rotate_logs(); }
            }
            { std::lock_guard<std::mutex> lock(queue_mutex_); in_flight_ -= written; }
            drained_cv_.notify_all();
        }
    }
public:
    AsyncLogger(const std::string& filename = "", size_t max_file_size = 10*1024*1024, int max_files = 5,
                bool echo_console = true, Level min_level = INFO)
        : base_filename_(filename), max_file_size_(max_file_size), current_file_size_(0),
          max_rotated_files_(max_files), echo_to_console_(echo_console), min_level_(min_level) {
        if (!filename.empty()) { log_file_.open(filename, std::ios::app); if (log_file_.is_open()) { log_file_.seekp(0, std::ios::end); current_file_size_ = static_cast<size_t>(log_file_.tellp()); } }
        worker_ = std::thread(&AsyncLogger::worker_loop, this);
    }
    ~AsyncLogger() { { std::lock_guard<std::mutex> lock(queue_mutex_); running_ = false; } cv_.notify_one(); if (worker_.joinable()) worker_.join(); }
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool enabled(Level level) const { return level >= min_level_; }
    void log(Level level, const std::string& msg) {
        if (!enabled(level)) return;
        { std::lock_guard<std::mutex> lock(queue_mutex_); if (!running_) return; queue_.push({level, msg, std::chrono::system_clock::now()}); ++in_flight_; }
        cv_.notify_one();
    }
    // Blocks until every entry queued so far has been written.
    void flush() {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        drained_cv_.wait(lock, [this] { return in_flight_ == 0; });
    }
};

// Null-tolerant helper for components that take an optional logger.
inline void log_to(AsyncLogger* logger, AsyncLogger::Level level, const std::string& msg) {
    if (logger) logger->log(level, msg);
}

#endif
