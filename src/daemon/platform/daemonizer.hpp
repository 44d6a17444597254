#pragma once

namespace platform {

// Detaches from the controlling terminal. Returns only in the grandchild.
void daemonize();

} // namespace platform
