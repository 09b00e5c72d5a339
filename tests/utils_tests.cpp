#include "test_common.hpp"
#include "parse_utils.hpp"
#include "text_utils.hpp"
#include "time_utils.hpp"
#include <cstdint>
#include <regex>

TEST_CASE("is_valid_utf8") {
    REQUIRE(is_valid_utf8(""));
    REQUIRE(is_valid_utf8("main"));
    REQUIRE(is_valid_utf8("feature/\xC3\xA9t\xC3\xA9"));
    REQUIRE(is_valid_utf8("\xF0\x9F\x9A\xA8"));
    REQUIRE_FALSE(is_valid_utf8("bad\xFF"));
    REQUIRE_FALSE(is_valid_utf8("\xC0\xAF"));         // overlong slash
    REQUIRE_FALSE(is_valid_utf8("\xED\xA0\x80"));     // surrogate
    REQUIRE_FALSE(is_valid_utf8("\xF4\x90\x80\x80")); // above U+10FFFF
    REQUIRE_FALSE(is_valid_utf8("\xE2\x82"));         // truncated
}

TEST_CASE("utf8_lossy replaces malformed bytes") {
    REQUIRE(utf8_lossy("plain") == "plain");
    REQUIRE(utf8_lossy("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
    REQUIRE(utf8_lossy("\xC3\xA9\xFE\xFE") == "\xC3\xA9\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("starts_with is case-sensitive") {
    REQUIRE(starts_with("https://github.com/org/repo", "https://github.com/"));
    REQUIRE_FALSE(starts_with("HTTPS://github.com/org/repo", "https://github.com/"));
    REQUIRE_FALSE(starts_with("https://git", "https://github.com/"));
    REQUIRE(starts_with("anything", ""));
}

TEST_CASE("parse_size_t bounds") {
    bool ok = false;
    REQUIRE(parse_size_t("42", 0, 100, ok) == 42);
    REQUIRE(ok);
    parse_size_t("101", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("-1", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("99999999999999999999999", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units") {
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("512b", 0, SIZE_MAX, ok) == 512);
    REQUIRE(parse_bytes("4k", 0, SIZE_MAX, ok) == 4096);
    REQUIRE(parse_bytes("2MB", 0, SIZE_MAX, ok) == 2u * 1024 * 1024);
    REQUIRE(parse_bytes("1G", 0, SIZE_MAX, ok) == 1024u * 1024 * 1024);
    REQUIRE(ok);
    parse_bytes("3t", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("k", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool spellings") {
    bool ok = false;
    REQUIRE(parse_bool("", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("Yes", ok));
    REQUIRE_FALSE(parse_bool("off", ok));
    REQUIRE(ok);
    parse_bool("perhaps", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("timestamp format") {
    REQUIRE(std::regex_match(timestamp(),
                             std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")));
}

TEST_CASE("format_elapsed") {
    using std::chrono::milliseconds;
    REQUIRE(format_elapsed(milliseconds(850)) == "850ms");
    REQUIRE(format_elapsed(milliseconds(5000)) == "5s");
    REQUIRE(format_elapsed(milliseconds(61000)) == "1m1s");
    REQUIRE(format_elapsed(milliseconds(3723000)) == "1h2m3s");
    REQUIRE(format_elapsed(milliseconds(3600000)) == "1h0m0s");
}

TEST_CASE("enum names") {
    REQUIRE(std::string(to_string(SyncStatus::AheadOfUpstream)) == "ahead_of_upstream");
    REQUIRE(std::string(to_string(SyncStatus::UpstreamRemoteNotSynced)) ==
            "upstream_remote_not_synced");
    REQUIRE(std::string(to_string(Severity::Critical)) == "critical");
    REQUIRE(std::string(to_string(EntryKind::NotRepository)) == "not_repository");
}

TEST_CASE("Diagnostics drops verbose-only lines unless verbose") {
    Diagnostics quiet("/srv/repos/a", false);
    quiet.detail("hidden");
    quiet.warning("shown");
    REQUIRE(quiet.size() == 1);
    REQUIRE(quiet.items()[0].severity == Severity::Warning);

    Diagnostics loud("/srv/repos/a", true);
    loud.detail("hidden");
    loud.error("shown");
    auto items = loud.take();
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].verbose_only);
    REQUIRE(loud.size() == 0);
}
