#pragma once

namespace localmesh::process {

// Blocks SIGINT and SIGTERM in the calling thread. Must run before any other
// thread is started so every thread inherits the mask and the signals stay
// pending for waitForTerminationSignal().
void blockTerminationSignals();

// Waits for SIGINT or SIGTERM and returns the signal number. Runs in ordinary
// thread context, so the caller may take locks and call into gRPC.
int waitForTerminationSignal();

}
