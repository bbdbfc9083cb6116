#include <doctest/doctest.h>
#include <yxa/env_file.hpp>

#include <filesystem>
#include <fstream>

using namespace yxa;

TEST_CASE("env file parses KEY=VALUE lines") {
    auto r = parse_env_file("ENV_VAR=env-value\nAPI_KEY=secret-key\n");
    REQUIRE(r.ok);
    CHECK(r.values.size() == 2);
    CHECK(r.values.at("ENV_VAR") == "env-value");
    CHECK(r.values.at("API_KEY") == "secret-key");
}

TEST_CASE("env file skips blank lines and comments") {
    auto r = parse_env_file("# header\n\n   \nA=1 # trailing\n  # indented comment\nB=x#y\n");
    REQUIRE(r.ok);
    CHECK(r.values.size() == 2);
    CHECK(r.values.at("A") == "1");
    CHECK(r.values.at("B") == "x#y");
}

TEST_CASE("env file accepts export prefix and spacing") {
    auto r = parse_env_file("export FOO=bar\n  BAZ =  qux  \n");
    REQUIRE(r.ok);
    CHECK(r.values.at("FOO") == "bar");
    CHECK(r.values.at("BAZ") == "qux");
}

TEST_CASE("env file handles quoting") {
    auto r = parse_env_file(
        "DQ=\"hello world\"\n"
        "SQ='it is $LITERAL'\n"
        "ESC=\"line1\\nline2 \\\"q\\\"\"\n"
        "HASH=\"a # not a comment\" # comment\n"
        "EMPTY=\n");
    REQUIRE(r.ok);
    CHECK(r.values.at("DQ") == "hello world");
    CHECK(r.values.at("SQ") == "it is $LITERAL");
    CHECK(r.values.at("ESC") == "line1\nline2 \"q\"");
    CHECK(r.values.at("HASH") == "a # not a comment");
    CHECK(r.values.at("EMPTY").empty());
}

TEST_CASE("env file tolerates CRLF line endings") {
    auto r = parse_env_file("A=1\r\nB=2\r\n");
    REQUIRE(r.ok);
    CHECK(r.values.at("A") == "1");
    CHECK(r.values.at("B") == "2");
}

TEST_CASE("later declarations replace earlier ones") {
    auto r = parse_env_file("A=1\nA=2\n");
    REQUIRE(r.ok);
    CHECK(r.values.at("A") == "2");
}

TEST_CASE("env file rejects lines without '='") {
    auto r = parse_env_file("A=1\nnot a declaration\n", "proj/.env");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("proj/.env:2") != std::string::npos);
}

TEST_CASE("env file rejects invalid keys and unterminated quotes") {
    CHECK_FALSE(parse_env_file("=value\n").ok);
    CHECK_FALSE(parse_env_file("BAD KEY=value\n").ok);
    CHECK_FALSE(parse_env_file("A=\"open\n").ok);
}

TEST_CASE("read_env_file reads from disk") {
    auto path = std::filesystem::temp_directory_path() / "yxa_env_file_test.env";
    std::ofstream(path) << "FROM_DISK=yes\n";

    auto r = read_env_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(r.ok);
    CHECK(r.values.at("FROM_DISK") == "yes");
}

TEST_CASE("read_env_file reports a missing file") {
    auto r = read_env_file("/path/that/does/not/exist/.env");
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}
