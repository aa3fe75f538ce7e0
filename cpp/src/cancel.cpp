#include "polyvid/cancel.hpp"

#include "polyvid/errors.hpp"

#include <csignal>

namespace polyvid::cancel {

namespace {

volatile std::sig_atomic_t g_requested = 0;

extern "C" void HandleSignal(int) {
    g_requested = 1;
}

}  // namespace

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

bool Requested() noexcept {
    return g_requested != 0;
}

void Request() noexcept {
    g_requested = 1;
}

void Reset() noexcept {
    g_requested = 0;
}

void ThrowIfRequested() {
    if (g_requested != 0) {
        throw CancelledError();
    }
}

}  // namespace polyvid::cancel
