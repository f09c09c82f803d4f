#pragma once

#include <string>

namespace procfs {

bool process_exists(int pid);

// Read /proc/{pid}/comm, empty on failure.
std::string read_comm(int pid);

// Basename of the /proc/{pid}/exe target, empty on failure (e.g. other user's process).
std::string read_exe_name(int pid);

} // namespace procfs
