#include "cancellation.h"

#include <csignal>

namespace lumactl {

namespace {

CancellationToken g_processToken;

void handleSignal(int)
{
    g_processToken.cancel();
}

} // namespace

CancellationToken &processCancellation()
{
    return g_processToken;
}

void installInterruptHandlers()
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

} // namespace lumactl
