#include <zlib.h>
#include <nlohmann/json.hpp>
#include "test_common.hpp"

struct LoggerGuard {
    ~LoggerGuard() { shutdown_logger(); }
};

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

TEST_CASE("Logger writes levels above the threshold") {
    ts::TempDir dir("syncaudit_logger_levels");
    fs::path log = dir.path / "audit.log";
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::WARNING));
    REQUIRE(logger_initialized());
    log_debug("debug line");
    log_info("info line");
    log_warning("warning line");
    log_error("error line", {{"entry", "/srv/repos/a"}});
    log_critical("critical line");
    flush_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].find("[WARNING] warning line") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] error line entry=/srv/repos/a") != std::string::npos);
    REQUIRE(lines[2].find("[CRITICAL] critical line") != std::string::npos);

    set_log_level(LogLevel::DEBUG);
    log_debug("now visible");
    flush_logger();
    REQUIRE(read_lines(log).size() == 4);
}

TEST_CASE("Logger emits JSON lines") {
    ts::TempDir dir("syncaudit_logger_json");
    fs::path log = dir.path / "audit.jsonl";
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::DEBUG));
    set_json_logging(true);
    log_info("Fetching remote", {{"remote", "origin"}});
    log_info(std::string("bad \xFF byte"));
    flush_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    auto j = nlohmann::json::parse(lines[0]);
    REQUIRE(j["level"] == "INFO");
    REQUIRE(j["msg"] == "Fetching remote");
    REQUIRE(j["remote"] == "origin");
    REQUIRE(j.contains("timestamp"));
    REQUIRE_NOTHROW(nlohmann::json::parse(lines[1]));
}

TEST_CASE("Logger rotates and limits files") {
    ts::TempDir dir("syncaudit_logger_rotate");
    fs::path log = dir.path / "rotate.log";
    fs::path log1 = dir.path / "rotate.log.1";
    fs::path log2 = dir.path / "rotate.log.2";
    fs::path log3 = dir.path / "rotate.log.3";

    {
        LoggerGuard guard;
        REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
        for (int i = 0; i < 200; ++i)
            log_info("entry " + std::to_string(i));
        flush_logger();
    }
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));
    REQUIRE(fs::file_size(log) <= 200);
}

TEST_CASE("Logger compresses rotated files") {
    ts::TempDir dir("syncaudit_logger_gzip");
    fs::path log = dir.path / "gz.log";
    fs::path gz = dir.path / "gz.log.1.gz";

    {
        LoggerGuard guard;
        REQUIRE(init_logger(log.string(), LogLevel::INFO, 64, 1));
        set_log_compression(true);
        for (int i = 0; i < 20; ++i)
            log_info("compressed entry " + std::to_string(i));
        flush_logger();
    }
    REQUIRE(fs::exists(gz));
    REQUIRE_FALSE(fs::exists(dir.path / "gz.log.1"));

    gzFile in = gzopen(gz.string().c_str(), "rb");
    REQUIRE(in != nullptr);
    char buf[512];
    int n = gzread(in, buf, sizeof(buf) - 1);
    gzclose(in);
    REQUIRE(n > 0);
    buf[n] = '\0';
    REQUIRE(std::string(buf).find("compressed entry") != std::string::npos);
}

TEST_CASE("Logger keeps an uncompressed rotated file when compressing") {
    ts::TempDir dir("syncaudit_logger_gzip_plain");
    fs::path log = dir.path / "mixed.log";
    // Left behind by a rotation whose compression failed.
    std::ofstream(dir.path / "mixed.log.1") << "survivor\n";

    {
        LoggerGuard guard;
        REQUIRE(init_logger(log.string(), LogLevel::INFO, 64, 3));
        set_log_compression(true);
        log_info("a single entry long enough to pass the size limit " + std::string(32, 'x'));
        flush_logger();
    }
    REQUIRE(fs::exists(dir.path / "mixed.log.1.gz"));
    REQUIRE_FALSE(fs::exists(dir.path / "mixed.log.1"));
    auto kept = read_lines(dir.path / "mixed.log.2");
    REQUIRE(kept == std::vector<std::string>{"survivor"});
}

TEST_CASE("Logger reports an unopenable path") {
    LoggerGuard guard;
    REQUIRE_FALSE(init_logger("/nonexistent-dir/syncaudit/audit.log"));
    REQUIRE_FALSE(logger_initialized());
    REQUIRE_NOTHROW(log_error("dropped"));
}

TEST_CASE("parse_log_level accepts names case-insensitively") {
    bool ok = false;
    REQUIRE(parse_log_level("DEBUG", ok) == LogLevel::DEBUG);
    REQUIRE(ok);
    REQUIRE(parse_log_level("warn", ok) == LogLevel::WARNING);
    REQUIRE(parse_log_level("Err", ok) == LogLevel::ERR);
    REQUIRE(parse_log_level("critical", ok) == LogLevel::CRITICAL);
    parse_log_level("chatty", ok);
    REQUIRE_FALSE(ok);
}
