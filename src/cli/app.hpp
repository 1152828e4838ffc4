#pragma once
#include <iosfwd>

namespace librarian::cli {

// librarian-env exit codes
enum ExitCode {
    EXIT_OK = 0,
    EXIT_CONFIG_ERROR = 1,  // ConfigLoadError, message names the source
    EXIT_USAGE = 2,         // Bad arguments
    EXIT_CANNOT_EXECUTE = 127
};

// Run librarian-env with the given arguments. Normal output goes to `out`,
// diagnostics and help errors to `err`. `exec` replaces the process on
// success and only returns on failure.
int run(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace librarian::cli
