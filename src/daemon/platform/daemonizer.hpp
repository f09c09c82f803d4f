#pragma once

namespace platform {

// Detach from the controlling terminal. Returns only in the grandchild.
void daemonize();

} // namespace platform
