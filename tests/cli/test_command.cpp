#define BOOST_TEST_MODULE CommandLineTests
#include <boost/test/unit_test.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

#include "masklint/cli/command.hpp"
#include "masklint/cli/root_command.hpp"
#include "masklint/fs/output_directory.hpp"

using namespace masklint::cli;
using masklint::fs::OutputDirectory;
namespace stdfs = std::filesystem;

namespace {

// Records the context it was run with
class RecordingCommand : public Command {
public:
    RecordingCommand() : Command("record", "Records its context") {
        add_flag_with_short("output", "o", "Output directory");
        add_bool_flag_with_short("force", "f", "Force");
    }

    int run(CommandContext& ctx) override {
        last = ctx;
        ++runs;
        return 7;
    }

    CommandContext last;
    int runs = 0;
};

class TestRoot : public Command {
public:
    TestRoot() : Command("tool", "Test root") {
        add_persistent_flag("maskfile", "Maskfile", "maskfile.md");
    }
    int run(CommandContext&) override { return 0; }
};

int execute_args(Command& command, std::vector<std::string> args) {
    args.insert(args.begin(), "masklint");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return command.execute(static_cast<int>(argv.size()), argv.data());
}

// Redirects std::cerr and the std::clog log sink into one string for the
// lifetime of the object
struct CerrCapture {
    std::stringstream buffer;
    std::streambuf* old_cerr;
    std::streambuf* old_clog;
    CerrCapture()
        : old_cerr(std::cerr.rdbuf(buffer.rdbuf())),
          old_clog(std::clog.rdbuf(buffer.rdbuf())) {}
    ~CerrCapture() {
        std::cerr.rdbuf(old_cerr);
        std::clog.rdbuf(old_clog);
    }

    size_t line_count() const {
        const std::string text = buffer.str();
        return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    }
};

struct Workspace {
    OutputDirectory dir = OutputDirectory::ephemeral();

    std::string write(const std::string& name, const std::string& content) {
        const auto path = dir.path() / name;
        std::ofstream(path) << content;
        return path.string();
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(CommandSuite)

BOOST_AUTO_TEST_CASE(test_persistent_flag_before_subcommand) {
    TestRoot root;
    auto record = std::make_shared<RecordingCommand>();
    root.add_command(record);

    int status = execute_args(root, {"--maskfile", "tasks.md", "record", "-o", "out"});

    BOOST_CHECK_EQUAL(status, 7);
    BOOST_CHECK_EQUAL(record->runs, 1);
    BOOST_CHECK_EQUAL(record->last.get_flag("maskfile"), "tasks.md");
    BOOST_CHECK(record->last.is_user_provided("maskfile"));
    BOOST_CHECK_EQUAL(record->last.get_flag("output"), "out");
    BOOST_CHECK(!record->last.get_bool_flag("force"));
}

BOOST_AUTO_TEST_CASE(test_persistent_flag_after_subcommand) {
    TestRoot root;
    auto record = std::make_shared<RecordingCommand>();
    root.add_command(record);

    execute_args(root, {"record", "--output", "out", "--maskfile", "x.md", "--force"});

    BOOST_CHECK_EQUAL(record->last.get_flag("maskfile"), "x.md");
    BOOST_CHECK(record->last.get_bool_flag("force"));
}

BOOST_AUTO_TEST_CASE(test_persistent_flag_default) {
    TestRoot root;
    auto record = std::make_shared<RecordingCommand>();
    root.add_command(record);

    execute_args(root, {"record"});

    BOOST_CHECK_EQUAL(record->last.get_flag("maskfile"), "maskfile.md");
    BOOST_CHECK(!record->last.is_user_provided("maskfile"));
    BOOST_CHECK(!record->last.is_user_provided("output"));
}

BOOST_AUTO_TEST_CASE(test_unknown_subcommand_fails) {
    TestRoot root;
    root.add_command(std::make_shared<RecordingCommand>());

    CerrCapture capture;
    BOOST_CHECK_EQUAL(execute_args(root, {"lint"}), 1);
    BOOST_CHECK(capture.buffer.str().find("unknown command 'lint'") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_unknown_option_on_leaf_fails) {
    TestRoot root;
    auto record = std::make_shared<RecordingCommand>();
    root.add_command(record);

    CerrCapture capture;
    BOOST_CHECK_EQUAL(execute_args(root, {"record", "--bogus"}), 1);
    BOOST_CHECK_EQUAL(record->runs, 0);
}

BOOST_AUTO_TEST_CASE(test_positional_argument_on_leaf_fails) {
    TestRoot root;
    auto record = std::make_shared<RecordingCommand>();
    root.add_command(record);

    CerrCapture capture;
    BOOST_CHECK_EQUAL(execute_args(root, {"record", "extra", "junk"}), 1);
    BOOST_CHECK_EQUAL(record->runs, 0);
    BOOST_CHECK(capture.buffer.str().find("unexpected argument 'extra' for 'record'") !=
                std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(MasklintCliSuite)

BOOST_AUTO_TEST_CASE(test_dump_writes_every_script) {
    Workspace ws;
    const auto maskfile = ws.write("maskfile.md",
                                   "# Tasks\n"
                                   "## build\n```sh\nmake\n```\n"
                                   "## db\n### db migrate\n```py\nprint(1)\n```\n"
                                   "## game\n```lua\nprint(2)\n```\n");
    const auto output = (ws.dir.path() / "out" / "nested").string();

    auto root = RootCommand::create();
    int status = execute_args(*root, {"--maskfile", maskfile, "--config",
                                      ws.dir.path().string() + "/none.yaml",
                                      "dump", "--output", output});
    // An explicitly named config file must exist
    BOOST_CHECK_EQUAL(status, 1);

    status = execute_args(*root, {"--maskfile", maskfile, "dump", "-o", output});
    BOOST_CHECK_EQUAL(status, 0);
    BOOST_CHECK(stdfs::exists(stdfs::path(output) / "build.sh"));
    BOOST_CHECK(stdfs::exists(stdfs::path(output) / "db_migrate.py"));
    BOOST_CHECK(stdfs::exists(stdfs::path(output) / "game"));

    // Second dump into the same directory collides
    CerrCapture capture;
    status = execute_args(*root, {"dump", "-o", output, "--maskfile", maskfile});
    BOOST_CHECK_EQUAL(status, 1);
    BOOST_CHECK(capture.buffer.str().find("File exists") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_dump_requires_output) {
    Workspace ws;
    const auto maskfile = ws.write("maskfile.md", "## a\n```sh\nls\n```\n");

    auto root = RootCommand::create();
    CerrCapture capture;
    BOOST_CHECK_EQUAL(execute_args(*root, {"--maskfile", maskfile, "dump"}), 1);
    BOOST_CHECK(capture.buffer.str().find("--output") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_missing_maskfile_fails) {
    Workspace ws;
    auto root = RootCommand::create();
    CerrCapture capture;
    BOOST_CHECK_EQUAL(
        execute_args(*root, {"--maskfile", (ws.dir.path() / "nope.md").string(),
                             "run"}),
        1);
    BOOST_CHECK(capture.buffer.str().find("Maskfile error") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_run_with_missing_linter_names_handler) {
    Workspace ws;
    const auto maskfile = ws.write("maskfile.md", "## a\n```sh\nls\n```\n");
    // Console logging stays on at the default level
    const auto config = ws.write(
        "masklint.yaml",
        "linters:\n  shellcheck:\n    executable: masklint-no-such-linter-4711\n");

    auto root = RootCommand::create();
    CerrCapture capture;
    BOOST_CHECK_EQUAL(execute_args(*root, {"--maskfile", maskfile, "--config",
                                           config, "run"}),
                      1);
    BOOST_CHECK_EQUAL(capture.buffer.str(),
                      "Error: executable for shellcheck not found in $PATH\n");
    BOOST_CHECK_EQUAL(capture.line_count(), 1u);
}

BOOST_AUTO_TEST_CASE(test_broken_config_prints_one_error) {
    Workspace ws;
    const auto maskfile = ws.write("maskfile.md", "## a\n```sh\nls\n```\n");
    const auto config = ws.write("masklint.yaml", "linters: [unclosed\n");

    auto root = RootCommand::create();
    CerrCapture capture;
    BOOST_CHECK_EQUAL(execute_args(*root, {"--maskfile", maskfile, "--config",
                                           config, "dump", "-o",
                                           (ws.dir.path() / "out").string()}),
                      1);
    BOOST_CHECK_EQUAL(capture.line_count(), 1u);
    BOOST_CHECK(capture.buffer.str().rfind("Error: Configuration error: ", 0) == 0);
}

BOOST_AUTO_TEST_CASE(test_run_rejects_extra_arguments) {
    Workspace ws;
    const auto maskfile = ws.write("maskfile.md", "## a\n```sh\nls\n```\n");

    auto root = RootCommand::create();
    CerrCapture capture;
    BOOST_CHECK_EQUAL(
        execute_args(*root, {"--maskfile", maskfile, "run", "extra", "junk"}), 1);
    BOOST_CHECK_EQUAL(capture.buffer.str(),
                      "Error: unexpected argument 'extra' for 'run'\n");
}

BOOST_AUTO_TEST_CASE(test_run_catchall_only_reports_fixed_text) {
    Workspace ws;
    const auto maskfile = ws.write("maskfile.md", "## game\n```lua\nprint(1)\n```\n");
    const auto config = ws.write("masklint.yaml", "report:\n  emphasis: never\n");

    std::stringstream captured;
    std::streambuf* old = std::cout.rdbuf(captured.rdbuf());
    auto root = RootCommand::create();
    int status = execute_args(*root, {"--maskfile", maskfile, "--config", config, "run"});
    std::cout.rdbuf(old);

    BOOST_CHECK_EQUAL(status, 0);
    BOOST_CHECK_EQUAL(captured.str(), "game\nno linter found for target\n\n");
}

BOOST_AUTO_TEST_SUITE_END()
