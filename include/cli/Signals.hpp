#pragma once

namespace ms::cli {

// SIGINT and SIGTERM request a graceful shutdown once. The handler then
// restores the default disposition, so a second signal terminates the process.
void installShutdownHandlers();

[[nodiscard]] bool shutdownRequested();

}
