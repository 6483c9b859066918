#pragma once

#include <vector>

// Process tree inspection through procfs.
namespace proc {

// Direct children of pid, across all of its threads.
std::vector<int> children(int pid);

// pid followed by all of its descendants, parents before children.
std::vector<int> process_tree(int pid);

// False for processes that no longer exist or are zombies.
bool is_running(int pid);

} // namespace proc
