#pragma once

namespace timber_mcp {

// Install SIGINT/SIGTERM handlers that only record the request.
// The handlers do not restart interrupted reads, so a blocking read on stdin
// returns and the session loop can observe ShutdownRequested().
// Installing the handlers clears any earlier request.
void InstallShutdownHandlers();

[[nodiscard]] bool ShutdownRequested() noexcept;

} // namespace timber_mcp
