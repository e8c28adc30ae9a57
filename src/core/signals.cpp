#include <timber_mcp/core/signals.hpp>

#include <atomic>
#include <csignal>

#ifndef _WIN32
#include <signal.h>
#endif

namespace timber_mcp {

namespace {

std::atomic<bool> g_shutdown_requested{false};

void OnShutdownSignal(int /*signum*/) {
    g_shutdown_requested.store(true);
}

} // anonymous namespace

void InstallShutdownHandlers() {
    g_shutdown_requested.store(false);

#ifdef _WIN32
    std::signal(SIGINT, OnShutdownSignal);
    std::signal(SIGTERM, OnShutdownSignal);
#else
    struct sigaction action {};
    action.sa_handler = OnShutdownSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

bool ShutdownRequested() noexcept {
    return g_shutdown_requested.load();
}

} // namespace timber_mcp
