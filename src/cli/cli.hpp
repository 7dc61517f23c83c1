#pragma once

#include <iosfwd>

namespace easepath::cli
{

// Exit codes of the easepath command.
enum ExitCode : int
{
    kExitOk          = 0,
    kExitError       = 1,   // bad command line, unreadable or malformed track
    kExitNoSelection = 2,   // no track file given
};

// Runs the command line. Converted paths go to `out`; usage text and log
// output go to stderr.
int run(int argc, char* argv[], std::ostream& out);

}   // namespace easepath::cli
