#include "proc_tree.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace proc {

std::vector<int> children(int pid) {
    std::vector<int> result;

    std::string task_path = std::format("/proc/{}/task", pid);
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(task_path, ec)) {
        std::ifstream f(entry.path() / "children");
        if (!f.is_open()) continue;

        int child;
        while (f >> child) {
            result.push_back(child);
        }
    }

    return result;
}

std::vector<int> process_tree(int pid) {
    if (pid <= 0) return {};

    std::vector<int> tree{pid};
    for (size_t i = 0; i < tree.size(); i++) {
        for (int child : children(tree[i])) {
            // A pid can be reused while we walk; never visit one twice.
            if (std::find(tree.begin(), tree.end(), child) == tree.end()) {
                tree.push_back(child);
            }
        }
    }
    return tree;
}

bool is_running(int pid) {
    if (pid <= 0) return false;

    std::ifstream f(std::format("/proc/{}/stat", pid));
    if (!f.is_open()) return false;

    std::string stat;
    std::getline(f, stat);

    // "pid (comm) S ..." where comm may itself contain ')'.
    auto close = stat.rfind(')');
    if (close == std::string::npos || close + 2 >= stat.size()) return false;

    char state = stat[close + 2];
    return state != 'Z' && state != 'X';
}

} // namespace proc
