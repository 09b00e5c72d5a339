#include "options.hpp"
#include <cstdint>
#include <cstdlib>
#include <map>
#include <pwd.h>
#include <set>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

AuditConfig Options::audit_config() const {
    AuditConfig cfg;
    cfg.ssh_private_key = ssh_private_key;
    cfg.default_username = username;
    cfg.qualifying_prefixes = qualifying_prefixes;
    cfg.verbose = verbose;
    return cfg;
}

static const std::set<std::string> KNOWN_FLAGS{
    "--help",         "--version",       "--verbose",       "--ssh-private-key",
    "--username",     "--qualifying-prefix", "--format",    "--quiet",
    "--strict",       "--log-file",      "--log-level",     "--json-log",
    "--max-log-size", "--max-log-files", "--compress-logs", "--config-yaml",
    "--config-json"};

static const std::set<std::string> VALUE_FLAGS{
    "--ssh-private-key", "--username",     "--qualifying-prefix", "--format",
    "--log-file",        "--log-level",    "--max-log-size",      "--max-log-files",
    "--config-yaml",     "--config-json"};

static const std::map<char, std::string> SHORT_FLAGS{
    {'h', "--help"},     {'V', "--version"},   {'a', "--verbose"},
    {'i', "--ssh-private-key"}, {'u', "--username"}, {'q', "--qualifying-prefix"},
    {'f', "--format"},   {'l', "--log-file"},  {'L', "--log-level"},
    {'y', "--config-yaml"}, {'j', "--config-json"}};

/// Options that may only appear on the command line.
static const std::set<std::string> CLI_ONLY{"--help", "--version", "--config-yaml",
                                            "--config-json"};

static ConfigValues load_config(const ArgParser& parser, fs::path& config_file) {
    ConfigValues cfg;
    std::string err;
    if (parser.has_flag("--config-yaml")) {
        config_file = parser.get_option("--config-yaml");
        if (!load_yaml_config(config_file.string(), cfg, err))
            throw std::runtime_error("Failed to load config " + config_file.string() + ": " + err);
    }
    if (parser.has_flag("--config-json")) {
        config_file = parser.get_option("--config-json");
        if (!load_json_config(config_file.string(), cfg, err))
            throw std::runtime_error("Failed to load config " + config_file.string() + ": " + err);
    }
    for (const auto& kv : cfg) {
        if (kv.first == "--repos-directory")
            continue;
        if (!KNOWN_FLAGS.count(kv.first) || CLI_ONLY.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first.substr(2));
    }
    return cfg;
}

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, KNOWN_FLAGS, VALUE_FLAGS, SHORT_FLAGS);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);

    Options opts;
    ConfigValues cfg = load_config(parser, opts.config_file);

    // Command line first, then the config file.
    auto values = [&](const std::string& k) {
        auto cli = parser.get_all_options(k);
        if (!cli.empty())
            return cli;
        auto it = cfg.find(k);
        return it != cfg.end() ? it->second : std::vector<std::string>{};
    };
    auto value = [&](const std::string& k) {
        auto v = values(k);
        return v.empty() ? std::string() : v.back();
    };
    auto given = [&](const std::string& k) { return parser.has_flag(k) || cfg.count(k) > 0; };
    // A bare flag is on; `--flag=value` and config values go through parse_bool.
    auto flag = [&](const std::string& k) {
        if (!given(k))
            return false;
        const std::string v = parser.has_flag(k) ? parser.get_option(k) : value(k);
        bool ok = false;
        bool on = parse_bool(v, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k + ": " + v);
        return on;
    };

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.verbose = flag("--verbose");
    opts.quiet = flag("--quiet");
    opts.strict = flag("--strict");

    if (!parser.positional().empty())
        opts.repos_directory = parser.positional().front();
    else if (cfg.count("--repos-directory"))
        opts.repos_directory = value("--repos-directory");
    if (given("--ssh-private-key"))
        opts.ssh_private_key = value("--ssh-private-key");
    if (given("--username")) {
        opts.username = value("--username");
        if (opts.username.empty())
            throw std::runtime_error("--username requires a name");
    }
    if (given("--qualifying-prefix")) {
        opts.qualifying_prefixes.clear();
        for (const auto& p : values("--qualifying-prefix")) {
            if (p.empty())
                throw std::runtime_error("--qualifying-prefix requires a non-empty prefix");
            opts.qualifying_prefixes.push_back(p);
        }
    }
    if (given("--format")) {
        std::string f = value("--format");
        if (f == "text")
            opts.format = OutputFormat::Text;
        else if (f == "json")
            opts.format = OutputFormat::Json;
        else
            throw std::runtime_error("Invalid value for --format: " + f);
    }

    LoggingOptions& lo = opts.logging;
    if (given("--log-file"))
        lo.log_file = value("--log-file");
    if (given("--log-level")) {
        bool ok = false;
        lo.log_level = parse_log_level(value("--log-level"), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-level: " + value("--log-level"));
    } else if (opts.verbose) {
        lo.log_level = LogLevel::DEBUG;
    }
    lo.json_log = flag("--json-log");
    lo.compress_logs = flag("--compress-logs");
    if (given("--max-log-size")) {
        bool ok = false;
        lo.max_log_size = parse_bytes(value("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (given("--max-log-files")) {
        bool ok = false;
        lo.max_log_files = parse_size_t(value("--max-log-files"), 0, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    return opts;
}

fs::path home_directory() {
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home);
    struct passwd pwd;
    struct passwd* result = nullptr;
    char buf[4096];
    if (getpwuid_r(getuid(), &pwd, buf, sizeof(buf), &result) == 0 && result && pwd.pw_dir &&
        *pwd.pw_dir)
        return fs::path(pwd.pw_dir);
    throw std::runtime_error("Failed to get home directory");
}

void resolve_defaults(Options& opts) {
    if (opts.repos_directory.empty()) {
        std::error_code ec;
        opts.repos_directory = fs::current_path(ec);
        if (ec)
            throw std::runtime_error("Failed to get current directory: " + ec.message());
    }
    if (opts.ssh_private_key.empty())
        opts.ssh_private_key = home_directory() / ".ssh" / "id_rsa";
}

void validate_preflight(const Options& opts) {
    std::error_code ec;
    fs::file_status st = fs::status(opts.ssh_private_key, ec);
    if (ec || !fs::exists(st))
        throw std::runtime_error("Failed to get metadata for ssh private key: " +
                                 opts.ssh_private_key.string() +
                                 (ec ? " (" + ec.message() + ")" : std::string()));
    if (!fs::is_regular_file(st))
        throw std::runtime_error("The ssh private key path is not a file: " +
                                 opts.ssh_private_key.string());
    fs::directory_iterator it(opts.repos_directory, ec);
    if (ec)
        throw std::runtime_error("Failed to read repositories directory " +
                                 opts.repos_directory.string() + ": " + ec.message());
}
