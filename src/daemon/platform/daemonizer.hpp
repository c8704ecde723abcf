#pragma once

namespace platform {

// Detaches from the terminal. Only the grandchild returns; the working
// directory is kept so relative sidecar lookups still resolve.
void daemonize();

} // namespace platform
