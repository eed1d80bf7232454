// signals.cpp - Signal handling for the shared cancel token.

#include "system/signals.hpp"

#include <csignal>

namespace imagine {

namespace {
std::atomic<CancelToken*> g_token{nullptr};
} // namespace

static void HandleSignal(int) {
    CancelToken* token = g_token.load(std::memory_order_relaxed);
    if (token) token->Cancel();
}

void InstallSignalHandlers(CancelToken& token) {
    g_token.store(&token, std::memory_order_relaxed);
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

} // namespace imagine
