#pragma once

#include "cli/Args.hpp"

#include <atomic>
#include <iosfwd>

namespace pith::cli {

namespace exit_code {
constexpr int OK = 0;
constexpr int BUILD_FAILED = 1;
constexpr int CONFIG_ERROR = 2;
constexpr int IO_ERROR = 3;
constexpr int USAGE = 64;
}

int runBuild(const Args& args, std::ostream& out, std::ostream& err);
int runStatus(const Args& args, std::ostream& out, std::ostream& err);
int runWatch(const Args& args, const std::atomic<bool>& shouldExit);

// Parses argv, initializes configuration and logging, runs the command.
int dispatch(int argc, char** argv, const std::atomic<bool>& shouldExit);

}
