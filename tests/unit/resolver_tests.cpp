#include <doctest/doctest.h>
#include <yxa/project_config.hpp>
#include <yxa/resolver.hpp>

#include <cstdlib>

using namespace yxa;

namespace {

// Sets a process variable for the lifetime of the guard
struct ScopedEnv {
    std::string name;
    ScopedEnv(const std::string& n, const std::string& value) : name(n) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }
    ~ScopedEnv() { ::unsetenv(name.c_str()); }
};

struct Sources {
    VariableMap declared;
    VariableMap overlay;

    ResolutionContext context() const {
        ResolutionContext ctx;
        ctx.declared = &declared;
        ctx.overlay = &overlay;
        return ctx;
    }
};

} // namespace

TEST_CASE("declared variables win over overlay and process environment") {
    ScopedEnv env("YXA_TEST_PRECEDENCE", "from-process");
    Sources s;
    s.declared["YXA_TEST_PRECEDENCE"] = "from-document";
    s.overlay["YXA_TEST_PRECEDENCE"] = "from-env-file";

    CHECK(resolve_variables(s.context(), "$YXA_TEST_PRECEDENCE") == "from-document");
    CHECK(resolve_variables(s.context(), "${YXA_TEST_PRECEDENCE}") == "from-document");
}

TEST_CASE("overlay wins over process environment") {
    ScopedEnv env("YXA_TEST_OVERLAY", "from-process");
    Sources s;
    s.overlay["YXA_TEST_OVERLAY"] = "from-env-file";

    CHECK(resolve_variables(s.context(), "$YXA_TEST_OVERLAY") == "from-env-file");
}

TEST_CASE("process environment is the last source") {
    ScopedEnv env("YXA_TEST_PROCESS_ONLY", "sys_value");
    Sources s;

    CHECK(resolve_variables(s.context(), "v=$YXA_TEST_PROCESS_ONLY") == "v=sys_value");
}

TEST_CASE("process environment is read at lookup time") {
    Sources s;
    ResolutionContext ctx = s.context();
    ::unsetenv("YXA_TEST_LATE");

    CHECK(resolve_variables(ctx, "$YXA_TEST_LATE") == "$YXA_TEST_LATE");

    ScopedEnv env("YXA_TEST_LATE", "later");
    CHECK(resolve_variables(ctx, "$YXA_TEST_LATE") == "later");
}

TEST_CASE("set but empty process variable counts as present") {
    ScopedEnv env("YXA_TEST_EMPTY", "");
    Sources s;

    CHECK(resolve_variables(s.context(), "[$YXA_TEST_EMPTY]") == "[]");
}

TEST_CASE("unresolved placeholders are kept verbatim") {
    ::unsetenv("YXA_TEST_NOWHERE");
    Sources s;

    CHECK(resolve_variables(s.context(), "echo $YXA_TEST_NOWHERE") == "echo $YXA_TEST_NOWHERE");
    CHECK(resolve_variables(s.context(), "echo ${YXA_TEST_NOWHERE}/x") == "echo ${YXA_TEST_NOWHERE}/x");
}

TEST_CASE("substitution is not recursive") {
    Sources s;
    s.declared["A"] = "$B";
    s.declared["B"] = "value";
    s.declared["SELF"] = "${SELF}";

    CHECK(resolve_variables(s.context(), "$A") == "$B");
    CHECK(resolve_variables(s.context(), "$SELF") == "${SELF}");
}

TEST_CASE("bare names are matched greedily") {
    ::unsetenv("YXA_TEST_FOOBAR");
    Sources s;
    s.declared["YXA_TEST_FOO"] = "1";

    CHECK(resolve_variables(s.context(), "$YXA_TEST_FOOBAR") == "$YXA_TEST_FOOBAR");
    CHECK(resolve_variables(s.context(), "${YXA_TEST_FOO}BAR") == "1BAR");
    CHECK(resolve_variables(s.context(), "$YXA_TEST_FOO-bar") == "1-bar");
}

TEST_CASE("adjacent placeholders resolve independently") {
    Sources s;
    s.declared["A"] = "1";
    s.declared["B"] = "2";

    CHECK(resolve_variables(s.context(), "$A$B") == "12");
    CHECK(resolve_variables(s.context(), "${A}${B}") == "12");
    CHECK(resolve_variables(s.context(), "$$A") == "$1");
}

TEST_CASE("text that is not a placeholder is copied literally") {
    Sources s;
    s.declared["FOO"] = "bar";

    CHECK(resolve_variables(s.context(), "") == "");
    CHECK(resolve_variables(s.context(), "cost: 5$") == "cost: 5$");
    CHECK(resolve_variables(s.context(), "${}") == "${}");
    CHECK(resolve_variables(s.context(), "${FOO") == "${FOO");
    CHECK(resolve_variables(s.context(), "${FOO-x}") == "${FOO-x}");
    CHECK(resolve_variables(s.context(), "$(date) $-") == "$(date) $-");
    CHECK(resolve_variables(s.context(), "{FOO}") == "{FOO}");
}

TEST_CASE("names may start with a digit") {
    Sources s;
    s.declared["1"] = "one";

    CHECK(resolve_variables(s.context(), "$1 ${1}") == "one one");
}

TEST_CASE("parameters take precedence over declared variables") {
    Sources s;
    s.declared["PARAM1"] = "declared";
    VariableMap params{{"PARAM1", "from-param"}};

    ResolutionContext ctx = s.context();
    ctx.parameters = &params;

    CHECK(resolve_variables(ctx, "$PARAM1") == "from-param");
}

TEST_CASE("process environment can be disabled") {
    ScopedEnv env("YXA_TEST_HIDDEN", "visible");
    Sources s;
    ResolutionContext ctx = s.context();
    ctx.use_process_environment = false;

    CHECK(resolve_variables(ctx, "$YXA_TEST_HIDDEN") == "$YXA_TEST_HIDDEN");
    CHECK_FALSE(lookup_variable(ctx, "YXA_TEST_HIDDEN").has_value());
}

TEST_CASE("lookup_variable follows the same order") {
    Sources s;
    s.declared["X"] = "d";
    s.overlay["X"] = "o";
    s.overlay["Y"] = "o";

    CHECK(lookup_variable(s.context(), "X") == std::optional<std::string>("d"));
    CHECK(lookup_variable(s.context(), "Y") == std::optional<std::string>("o"));
}

TEST_CASE("resolve_variables reports missing names in order") {
    ::unsetenv("YXA_TEST_M1");
    ::unsetenv("YXA_TEST_M2");
    Sources s;
    s.declared["OK"] = "fine";

    std::vector<std::string> missing;
    auto out = resolve_variables(s.context(), "$YXA_TEST_M2 $OK ${YXA_TEST_M1} $YXA_TEST_M2", missing);

    CHECK(out == "$YXA_TEST_M2 fine ${YXA_TEST_M1} $YXA_TEST_M2");
    REQUIRE(missing.size() == 3);
    CHECK(missing[0] == "YXA_TEST_M2");
    CHECK(missing[1] == "YXA_TEST_M1");
    CHECK(missing[2] == "YXA_TEST_M2");
}

TEST_CASE("resolve_variables_strict emits missing_variable warnings") {
    ::unsetenv("YXA_TEST_STRICT");
    Sources s;
    WarningCollector warnings;

    auto out = resolve_variables_strict(s.context(), "run $YXA_TEST_STRICT", "commands.build.run", warnings);

    CHECK(out == "run $YXA_TEST_STRICT");
    auto list = warnings.get_warnings();
    REQUIRE(list.size() == 1);
    CHECK(list[0].key == "missing_variable");
    CHECK(list[0].fields.at("missing") == "YXA_TEST_STRICT");
    CHECK(list[0].fields.at("source_path") == "commands.build.run");
}

TEST_CASE("resolve_all resolves each element") {
    Sources s;
    s.declared["DIR"] = "out";

    auto out = resolve_all(s.context(), {"mkdir $DIR", "rm -rf ${DIR}", "ls"});

    REQUIRE(out.size() == 3);
    CHECK(out[0] == "mkdir out");
    CHECK(out[1] == "rm -rf out");
    CHECK(out[2] == "ls");
}

TEST_CASE("resolve_command_lines resolves hooks and tasks") {
    ProjectConfig config;
    config.variables["OUT"] = "./output";
    config.env_file_vars["GREETING"] = "hi";

    Command cmd;
    cmd.run = "echo $GREETING";
    cmd.pre = "mkdir -p $OUT";
    cmd.post = "ls ${OUT}";
    cmd.tasks = {"touch $OUT/a", "touch $OUT/b"};

    auto lines = resolve_command_lines(make_resolution_context(config), cmd);

    CHECK(lines.run == "echo hi");
    CHECK(lines.pre == "mkdir -p ./output");
    CHECK(lines.post == "ls ./output");
    REQUIRE(lines.tasks.size() == 2);
    CHECK(lines.tasks[1] == "touch ./output/b");
}

TEST_CASE("resolve_run_lines rewrites run only, including sub-commands") {
    ProjectConfig config;
    config.variables["NAME"] = "app";

    Command build;
    build.run = "make $NAME";
    build.pre = "echo $NAME";
    build.condition = "$NAME == app";

    Command sub;
    sub.run = "echo ${NAME}";
    build.commands["inner"] = sub;
    config.commands["build"] = build;

    resolve_run_lines(config);

    const auto& resolved = config.commands.at("build");
    CHECK(resolved.run == "make app");
    CHECK(resolved.pre == "echo $NAME");
    CHECK(resolved.condition == "$NAME == app");
    CHECK(resolved.commands.at("inner").run == "echo app");
}
