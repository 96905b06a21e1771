#pragma once
#include <filesystem>
#include <string>

#include "masklint/lint/language_handler.hpp"
#include "masklint/maskfile/maskfile.hpp"

namespace masklint::fs {

// "db migrate" + ".sh" -> "db_migrate.sh"
std::string script_file_name(const std::string& qualified_name,
                             lint::LanguageHandler handler);

// Writes the handler-transformed script to a new file in directory and
// returns its path. Never overwrites: throws CollisionError when the file
// already exists and MaterializeError on any other I/O failure.
std::filesystem::path materialize(lint::LanguageHandler handler,
                                  const std::string& qualified_name,
                                  const maskfile::Script& script,
                                  const std::filesystem::path& directory);

}  // namespace masklint::fs
