#pragma once

namespace chs::common {

// Reports the active exception on stderr before the process dies.
void installTerminateHandler();

// Blocks until SIGINT or SIGTERM arrives and returns the signal number.
int waitForShutdownSignal();

}  // namespace chs::common
