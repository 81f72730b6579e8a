#include "ParameterContext.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

// argv storage that outlives the parser call
struct Args {
    std::vector<std::string> items;
    std::vector<char*> pointers;

    explicit Args(std::vector<std::string> list) : items(std::move(list)) {
        for (auto& item : items) {
            pointers.push_back(item.data());
        }
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(items.size()); }
    char** argv() { return pointers.data(); }
};

void clear_environment() {
    unsetenv("FLOWRUN_CONFIG_FILE");
    unsetenv("FLOWRUN_LOG_LEVEL");
}

}

// Test command line parameter parsing
void test_commandline_merge() {
    ParameterContext ctx;
    Args args({"flowrun", "--config-file=wf.yaml", "-a", "build", "-s", "target=release",
               "--set", "jobs=4", "--set=debug=false", "-n", "-v"});
    ctx.merge_commandline(args.argc(), args.argv());

    const auto& request = ctx.get_request();
    assert(request.config_file == "wf.yaml");
    assert(request.action == "build");
    assert(request.form.at("target") == Value("release"));
    assert(request.form.at("jobs") == Value(4));
    assert(request.form.at("debug") == Value(false));
    assert(request.dry_run);
    assert(!request.resolve_only);
    assert(!request.list_actions);
    assert(request.log_level == LogUtils::Level::Debug);
    std::cout << "Commandline merge test passed.\n";
}

void test_assignment_typing() {
    assert(ParameterContext::parse_assignment("a=1").second == Value(1));
    assert(ParameterContext::parse_assignment("a=1.5").second == Value(1.5));
    assert(ParameterContext::parse_assignment("a=yes").second == Value(true));
    assert(ParameterContext::parse_assignment("a=~").second.is_null());
    assert(ParameterContext::parse_assignment("a=").second == Value(""));
    assert(ParameterContext::parse_assignment("a=x=y").second == Value("x=y"));
    assert(ParameterContext::parse_assignment("a='007'").second == Value("007"));
    assert(ParameterContext::parse_assignment("a=[1, 2]").second == Value("[1, 2]"));
    assert(ParameterContext::parse_assignment(" key =v").first == "key");

    try {
        ParameterContext::parse_assignment("novalue");
        assert(false && "Should reject an assignment without '='");
    } catch (const UsageError&) {
    }
    try {
        ParameterContext::parse_assignment("=v");
        assert(false && "Should reject an empty key");
    } catch (const UsageError&) {
    }
    std::cout << "Assignment typing test passed.\n";
}

// Test environment variable merge
void test_environment_merge() {
    clear_environment();
    setenv("FLOWRUN_CONFIG_FILE", "/etc/flowrun/wf.yaml", 1);
    setenv("FLOWRUN_LOG_LEVEL", "warn", 1);

    ParameterContext ctx;
    ctx.merge_environment_vars();
    assert(ctx.get_request().config_file == "/etc/flowrun/wf.yaml");
    assert(ctx.get_request().log_level == LogUtils::Level::Warn);

    // Command line wins over the environment
    ParameterContext cli;
    Args args({"flowrun", "-c", "local.yaml", "-a", "x"});
    assert(cli.init(args.argc(), args.argv()));
    assert(cli.get_request().config_file == "local.yaml");
    assert(cli.get_request().log_level == LogUtils::Level::Warn);

    clear_environment();
    std::cout << "Environment merge test passed.\n";
}

void test_form_file_merge() {
    auto path = std::filesystem::temp_directory_path() / ("flowrun_form_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"target": "debug", "langs": ["en", "fr"], "jobs": 2})";
    }

    ParameterContext ctx;
    Args args({"flowrun", "-c", "wf.yaml", "-a", "build", "-f", path.string(), "-s", "target=release"});
    ctx.merge_commandline(args.argc(), args.argv());

    const auto& form = ctx.get_request().form;
    assert(form.at("target") == Value("release"));
    assert(form.at("jobs") == Value(2));
    assert(form.at("langs").as_list().size() == 2);

    {
        std::ofstream out(path);
        out << "[1, 2]";
    }
    try {
        ParameterContext other;
        other.merge_form_file(path.string());
        assert(false && "Should reject a form file that is not an object");
    } catch (const UsageError& e) {
        assert(std::string(e.what()).find("JSON object") != std::string::npos);
    }

    {
        std::ofstream out(path);
        out << "{broken";
    }
    try {
        ParameterContext other;
        other.merge_form_file(path.string());
        assert(false && "Should reject malformed JSON");
    } catch (const UsageError&) {
    }

    std::filesystem::remove(path);
    std::cout << "Form file merge test passed.\n";
}

void test_invalid_options() {
    {
        ParameterContext ctx;
        Args args({"flowrun", "--bogus"});
        try {
            ctx.parse_commandline(args.argc(), args.argv());
            assert(false && "Should reject an unknown long option");
        } catch (const UsageError& e) {
            assert(std::string(e.what()) == "Unknown option: --bogus");
        }
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "-a"});
        try {
            ctx.parse_commandline(args.argc(), args.argv());
            assert(false && "Should require a value");
        } catch (const UsageError& e) {
            assert(std::string(e.what()).find("requires a value") != std::string::npos);
        }
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "-xy"});
        try {
            ctx.parse_commandline(args.argc(), args.argv());
            assert(false && "Should reject grouped short options");
        } catch (const UsageError&) {
        }
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "--list=yes"});
        try {
            ctx.parse_commandline(args.argc(), args.argv());
            assert(false && "Should reject a value on a switch");
        } catch (const UsageError&) {
        }
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "stray"});
        try {
            ctx.parse_commandline(args.argc(), args.argv());
            assert(false && "Should reject positional arguments");
        } catch (const UsageError&) {
        }
    }
    std::cout << "Invalid options test passed.\n";
}

void test_validate() {
    clear_environment();
    {
        ParameterContext ctx;
        Args args({"flowrun", "-a", "build"});
        try {
            ctx.init(args.argc(), args.argv());
            assert(false && "Should require a workflow file");
        } catch (const UsageError& e) {
            assert(std::string(e.what()).find("--config-file") != std::string::npos);
        }
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "-c", "wf.yaml"});
        try {
            ctx.init(args.argc(), args.argv());
            assert(false && "Should require an action");
        } catch (const UsageError&) {
        }
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "-c", "wf.yaml", "--list"});
        assert(ctx.init(args.argc(), args.argv()));
        assert(ctx.get_request().list_actions);
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "-c", "wf.yaml", "-a", "build", "-r"});
        assert(ctx.init(args.argc(), args.argv()));
        assert(ctx.get_request().resolve_only);
    }
    std::cout << "Validate test passed.\n";
}

void test_help_and_version() {
    {
        ParameterContext ctx;
        Args args({"flowrun", "-?"});
        assert(!ctx.init(args.argc(), args.argv()));
    }
    {
        ParameterContext ctx;
        Args args({"flowrun", "--version"});
        assert(!ctx.init(args.argc(), args.argv()));
    }
    std::cout << "Help and version test passed.\n";
}

int main() {
    test_commandline_merge();
    test_assignment_typing();
    test_environment_merge();
    test_form_file_merge();
    test_invalid_options();
    test_validate();
    test_help_and_version();

    std::cout << "All ParameterContext tests passed!\n";
    return 0;
}
