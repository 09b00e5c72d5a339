#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

namespace fs = std::filesystem;

static std::mutex g_log_mtx;
static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static LogLevel g_min_level = LogLevel::INFO;
static size_t g_max_size = 0;
static size_t g_max_files = 1;
static bool g_json_log = false;
static bool g_compress_logs = false;

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    g_min_level = level;
    g_max_size = max_size;
    g_max_files = max_files;
    return true;
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_min_level = level;
}

void set_json_logging(bool enable) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_json_log = enable;
}

void set_log_compression(bool enable) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_compress_logs = enable;
}

LogLevel parse_log_level(const std::string& name, bool& ok) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ok = true;
    if (v == "debug")
        return LogLevel::DEBUG;
    if (v == "info")
        return LogLevel::INFO;
    if (v == "warning" || v == "warn")
        return LogLevel::WARNING;
    if (v == "error" || v == "err")
        return LogLevel::ERR;
    if (v == "critical")
        return LogLevel::CRITICAL;
    ok = false;
    return LogLevel::INFO;
}

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "INFO";
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

/**
 * @brief Shift `<path>.N` and `<path>.N.gz` up by one and move the active
 *        file to `.1`.
 *
 * Plain and compressed names are shifted together so a file whose
 * compression failed is kept like any other. Caller holds @ref g_log_mtx
 * and has closed the stream.
 */
static void rotate_files() {
    std::error_code ec;
    for (size_t i = g_max_files; i > 0; --i) {
        for (const char* suffix : {"", ".gz"}) {
            fs::path src = g_log_path + "." + std::to_string(i) + suffix;
            if (i == g_max_files) {
                fs::remove(src, ec);
            } else {
                fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
                fs::rename(src, dst, ec);
            }
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs) {
        fs::path gz = first;
        gz += ".gz";
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
        else
            fs::remove(gz, ec);
    }
}

static std::string format_line(LogLevel level, const std::string& msg, const LogFields& fields) {
    const std::string ts = timestamp();
    if (g_json_log) {
        nlohmann::json j;
        j["timestamp"] = ts;
        j["level"] = level_label(level);
        j["msg"] = msg;
        for (const auto& [k, v] : fields)
            j[k] = v;
        // Messages may carry non UTF-8 bytes from repository names.
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::string line = "[" + ts + "] [" + level_label(level) + "] " + msg;
    for (const auto& [k, v] : fields)
        line += " " + k + "=" + v;
    return line;
}

void log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open() || level < g_min_level)
        return;
    g_log_ofs << format_line(level, message, fields) << '\n';
    if (g_max_size == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size)
        return;
    g_log_ofs.close();
    if (g_max_files > 0)
        rotate_files();
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void log_debug(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::ERR, msg, fields);
}
void log_critical(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::CRITICAL, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    g_min_level = LogLevel::INFO;
    g_max_size = 0;
    g_max_files = 1;
    g_json_log = false;
    g_compress_logs = false;
}
