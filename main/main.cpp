#include "cli/Commands.hpp"

#include <atomic>
#include <csignal>

namespace {
std::atomic<bool> shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}
}

int main(const int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    return pith::cli::dispatch(argc, argv, shouldExit);
}
