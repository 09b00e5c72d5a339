#include "test_common.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE_FALSE(parser.has_flag("--bar"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val", "--flag=yes"};
    ArgParser parser(3, const_cast<char**>(argv), {"--opt", "--flag"}, {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
    REQUIRE(parser.get_option("--flag") == "yes");
}

TEST_CASE("ArgParser boolean flag leaves next argument positional") {
    const char* argv[] = {"prog", "--verbose", "/srv/repos"};
    ArgParser parser(3, const_cast<char**>(argv), {"--verbose"});
    REQUIRE(parser.has_flag("--verbose"));
    REQUIRE(parser.get_option("--verbose").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"/srv/repos"});
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-o42", "-x", "val"};
    ArgParser parser(5, const_cast<char**>(argv), {"--help", "--opt", "--xopt"},
                     {"--opt", "--xopt"}, {{'h', "--help"}, {'o', "--opt"}, {'x', "--xopt"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.get_option("--xopt") == "val");
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser clustered short flags") {
    const std::map<char, std::string> shorts{{'a', "--verbose"}, {'i', "--key"}};
    const std::set<std::string> known{"--verbose", "--key"};

    SECTION("value in next argument") {
        const char* argv[] = {"prog", "-ai", "id_ed25519", "repos"};
        ArgParser parser(4, const_cast<char**>(argv), known, {"--key"}, shorts);
        REQUIRE(parser.has_flag("--verbose"));
        REQUIRE(parser.get_option("--key") == "id_ed25519");
        REQUIRE(parser.positional() == std::vector<std::string>{"repos"});
    }

    SECTION("value attached") {
        const char* argv[] = {"prog", "-aikey"};
        ArgParser parser(2, const_cast<char**>(argv), known, {"--key"}, shorts);
        REQUIRE(parser.has_flag("--verbose"));
        REQUIRE(parser.get_option("--key") == "key");
    }

    SECTION("value after equals") {
        const char* argv[] = {"prog", "-i=key"};
        ArgParser parser(2, const_cast<char**>(argv), known, {"--key"}, shorts);
        REQUIRE(parser.get_option("--key") == "key");
    }
}

TEST_CASE("ArgParser unknown short option") {
    const char* argv[] = {"prog", "-z"};
    ArgParser parser(2, const_cast<char**>(argv), {"--help"}, {}, {{'h', "--help"}});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"-z"});
}

TEST_CASE("ArgParser repeated option keeps every value") {
    const char* argv[] = {"prog", "-q", "https://a/", "--prefix", "git@b:", "--prefix=ssh://c/"};
    ArgParser parser(6, const_cast<char**>(argv), {"--prefix"}, {"--prefix"},
                     {{'q', "--prefix"}});
    REQUIRE(parser.get_all_options("--prefix") ==
            std::vector<std::string>{"https://a/", "git@b:", "ssh://c/"});
    REQUIRE(parser.get_option("--prefix") == "ssh://c/");
    REQUIRE(parser.get_all_options("--missing").empty());
}

TEST_CASE("ArgParser reports missing values") {
    const char* argv[] = {"prog", "--opt"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"}, {"--opt"});
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--opt"});
    REQUIRE_FALSE(parser.has_flag("--opt"));
}

TEST_CASE("ArgParser double dash ends options") {
    const char* argv[] = {"prog", "--flag", "--", "--not-a-flag", "-"};
    ArgParser parser(5, const_cast<char**>(argv), {"--flag"});
    REQUIRE(parser.has_flag("--flag"));
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"--not-a-flag", "-"});
}

TEST_CASE("ArgParser empty known set accepts everything") {
    const char* argv[] = {"prog", "--anything", "--else=1"};
    ArgParser parser(3, const_cast<char**>(argv));
    REQUIRE(parser.has_flag("--anything"));
    REQUIRE(parser.get_option("--else") == "1");
    REQUIRE(parser.unknown_flags().empty());
}
