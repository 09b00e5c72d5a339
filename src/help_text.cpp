#include "help_text.hpp"
#include <algorithm>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    std::string long_flag;
    std::string short_flag;
    std::string arg;
    std::string desc;
    std::string category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    flag += o.short_flag.empty() ? "    " : o.short_flag + ", ";
    flag += o.long_flag;
    if (!o.arg.empty())
        flag += " " + o.arg;
    return flag;
}

void print_help(std::ostream& os, const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--verbose", "-a", "", "Show every entry, branch and fetched remote", "Basics"},
        {"--ssh-private-key", "-i", "<path>", "SSH private key (default ~/.ssh/id_rsa)",
         "Basics"},
        {"--username", "-u", "<name>", "SSH user when the URL has none (default git)", "Basics"},
        {"--qualifying-prefix", "-q", "<prefix>",
         "Trusted remote URL prefix (repeatable, replaces the GitHub defaults)", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print the version and exit", "Basics"},
        {"--format", "-f", "<text|json>", "Output format (json prints one object per entry)",
         "Output"},
        {"--quiet", "", "", "Do not print the summary line", "Output"},
        {"--strict", "", "", "Exit with 2 unless every branch is synced", "Output"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "Write a log file", "Logging"},
        {"--log-level", "-L", "<level>", "debug, info, warning, error or critical", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file above this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "syncaudit - check that every local branch is pushed to a trusted remote\n";
    os << "Fetches the qualifying remotes of each repository in a directory and\n";
    os << "reports branches that are ahead, diverged or not tracked.\n\n";
    os << "Usage: " << prog << " [options] [REPOS_DIRECTORY]\n\n";
    for (const std::string cat : {"Basics", "Output", "Config", "Logging"}) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
               << o->desc << "\n";
        os << "\n";
    }
}
