#pragma once
#include <stdexcept>
#include <string>

namespace masklint {

// Base of every error raised while loading, walking or linting a maskfile
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

// Maskfile could not be read or parsed
class SpecificationError : public Error {
public:
    explicit SpecificationError(const std::string& message)
        : Error("Maskfile error: " + message) {}
};

// Output directory could not be created or removed
class OutputDirectoryError : public Error {
public:
    explicit OutputDirectoryError(const std::string& message)
        : Error("Output directory error: " + message) {}
};

class MaterializeError : public Error {
public:
    explicit MaterializeError(const std::string& message) : Error(message) {}
};

// Target file already exists in the output directory
class CollisionError : public MaterializeError {
public:
    explicit CollisionError(const std::string& path)
        : MaterializeError("File exists: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Spawning or waiting on a child process failed
class ProcessError : public Error {
public:
    explicit ProcessError(const std::string& message) : Error(message) {}
};

// execvp reported ENOENT for the requested program
class ExecutableNotFoundError : public ProcessError {
public:
    explicit ExecutableNotFoundError(const std::string& program)
        : ProcessError("No such file or directory: " + program),
          program_(program) {}

    const std::string& program() const { return program_; }

private:
    std::string program_;
};

// The linter backing a language handler is not installed
class LinterNotFoundError : public Error {
public:
    explicit LinterNotFoundError(const std::string& handler_name)
        : Error("executable for " + handler_name + " not found in $PATH"),
          handler_name_(handler_name) {}

    const std::string& handler_name() const { return handler_name_; }

private:
    std::string handler_name_;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error("Configuration error: " + message) {}
};

}  // namespace masklint
