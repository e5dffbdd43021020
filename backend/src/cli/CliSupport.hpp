#pragma once
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>
#include "../core/Errors.hpp"

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_INVALID_PASSWORD = 2,
    EXIT_CORRUPT_DATA = 3,
    EXIT_LOCKED = 4,
    EXIT_KEY_NOT_FOUND = 5,
    EXIT_NO_KEY = 6,
    EXIT_IO = 7,
    EXIT_FAILURE_OTHER = 8
};

// One distinct, non-zero code per error kind.
int exitCodeFor(ErrorKind kind);

// Command line values are JSON when they parse as JSON ("42", "[1,2]",
// "{\"a\":1}") and plain strings otherwise.
nlohmann::json parseValueArg(const std::string& arg);

// Pretty JSON for stored JSON values; anything else is printed unchanged.
std::string formatValue(const std::string& stored);

// Ask a yes/no question on out and read the answer from in. Only "y" or
// "yes" (any case) agrees; end of input declines.
bool confirm(std::istream& in, std::ostream& out, const std::string& question);
