#include <doctest/doctest.h>
#include <yxa/config_json.hpp>

using namespace yxa;

TEST_CASE("project config renders without the environment overlay") {
    ProjectConfig config;
    config.name = "demo";
    config.variables["A"] = "1";
    config.env_file_vars["SECRET"] = "hidden";
    config.commands["build"].run = "make";
    config.commands["build"].depends = {"prepare"};

    auto j = project_config_to_json(config);

    CHECK(j["name"] == "demo");
    CHECK(j["variables"]["A"] == "1");
    CHECK(j["commands"]["build"]["run"] == "make");
    CHECK(j["commands"]["build"]["depends"][0] == "prepare");
    CHECK(j.dump().find("hidden") == std::string::npos);
    CHECK(j.dump().find("SECRET") == std::string::npos);
}

TEST_CASE("command rendering omits empty fields") {
    Command cmd;
    cmd.run = "echo hi";

    auto j = command_to_json(cmd);
    CHECK(j.size() == 1);
    CHECK(j["run"] == "echo hi");
}

TEST_CASE("command rendering includes params and sub-commands") {
    Command cmd;
    Param p;
    p.name = "target|t";
    p.default_value = "all";
    p.flag = true;
    cmd.params.push_back(p);
    cmd.commands["inner"].run = "echo inner";
    cmd.parallel = true;

    auto j = command_to_json(cmd);
    CHECK(j["params"][0]["name"] == "target|t");
    CHECK(j["params"][0]["type"] == "string");
    CHECK(j["params"][0]["default"] == "all");
    CHECK(j["params"][0]["flag"] == true);
    CHECK_FALSE(j["params"][0].contains("position"));
    CHECK(j["commands"]["inner"]["run"] == "echo inner");
    CHECK(j["parallel"] == true);
}

TEST_CASE("condition match renders by kind") {
    auto eq = condition_match_to_json(match_condition("a == b"));
    CHECK(eq["kind"] == "equals");
    CHECK(eq["left"] == "a");
    CHECK(eq["right"] == "b");

    auto ex = condition_match_to_json(match_condition("exists /tmp"));
    CHECK(ex["kind"] == "exists");
    CHECK(ex["path"] == "/tmp");

    auto none = condition_match_to_json(match_condition("nonsense"));
    CHECK(none["kind"] == "none");
    CHECK_FALSE(none.contains("left"));
}

TEST_CASE("issues and warnings render as arrays") {
    auto issues = config_issues_to_json({{"command timeout", "slow", "invalid timeout 'x'"}});
    REQUIRE(issues.size() == 1);
    CHECK(issues[0]["section"] == "command timeout");

    WarningObject w;
    w.key = "missing_variable";
    w.action = "warn";
    w.fields["missing"] = "FOO";
    auto warnings = warnings_to_json({w});
    CHECK(warnings[0]["fields"]["missing"] == "FOO");

    CHECK(config_issues_to_json({}).is_array());
}
