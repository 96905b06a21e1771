#define BOOST_TEST_MODULE ScriptMaterializerTests
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <sstream>

#include "masklint/core/errors.hpp"
#include "masklint/fs/output_directory.hpp"
#include "masklint/fs/script_materializer.hpp"

using namespace masklint::fs;
using masklint::lint::LanguageHandler;
using masklint::maskfile::Script;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

BOOST_AUTO_TEST_SUITE(ScriptMaterializerSuite)

BOOST_AUTO_TEST_CASE(test_file_name_from_qualified_name) {
    BOOST_CHECK_EQUAL(script_file_name("db migrate up", LanguageHandler::Shellcheck),
                      "db_migrate_up.sh");
    BOOST_CHECK_EQUAL(script_file_name("serve", LanguageHandler::Ruff), "serve.py");
    BOOST_CHECK_EQUAL(script_file_name("docs build", LanguageHandler::Catchall),
                      "docs_build");
}

BOOST_AUTO_TEST_CASE(test_writes_transformed_content) {
    auto dir = OutputDirectory::ephemeral();
    Script script{"zsh", "echo $HOME\n"};

    auto path = materialize(LanguageHandler::Shellcheck, "env show", script,
                            dir.path());

    BOOST_CHECK_EQUAL(path, dir.path() / "env_show.sh");
    BOOST_CHECK_EQUAL(read_file(path), "#!/bin/usr/env zsh\necho $HOME\n");
}

BOOST_AUTO_TEST_CASE(test_collision_preserves_existing_file) {
    auto dir = OutputDirectory::ephemeral();
    Script first{"py", "print('first')\n"};
    Script second{"py", "print('second')\n"};

    auto path = materialize(LanguageHandler::Ruff, "a b", first, dir.path());
    BOOST_CHECK_THROW(materialize(LanguageHandler::Ruff, "a b", second, dir.path()),
                      masklint::CollisionError);
    BOOST_CHECK_EQUAL(read_file(path), "print('first')\n");
}

BOOST_AUTO_TEST_CASE(test_space_and_underscore_names_collide) {
    auto dir = OutputDirectory::ephemeral();
    Script script{"lua", "print(1)\n"};

    materialize(LanguageHandler::Catchall, "a b", script, dir.path());
    try {
        materialize(LanguageHandler::Catchall, "a_b", script, dir.path());
        BOOST_FAIL("expected CollisionError");
    } catch (const masklint::CollisionError& e) {
        BOOST_CHECK_EQUAL(e.path(), (dir.path() / "a_b").string());
    }
}

BOOST_AUTO_TEST_CASE(test_missing_directory_is_generic_error) {
    auto dir = OutputDirectory::ephemeral();
    Script script{"rb", "puts 1\n"};

    try {
        materialize(LanguageHandler::Rubocop, "x", script, dir.path() / "missing");
        BOOST_FAIL("expected MaterializeError");
    } catch (const masklint::CollisionError&) {
        BOOST_FAIL("missing directory must not be reported as a collision");
    } catch (const masklint::MaterializeError&) {
    }
}

BOOST_AUTO_TEST_SUITE_END()
