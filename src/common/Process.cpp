#include "common/Process.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <thread>

namespace chs::common {
namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

}  // namespace

void installTerminateHandler() {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });
}

int waitForShutdownSignal() {
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    while (gSignalStatus == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return gSignalStatus;
}

}  // namespace chs::common
