// src/core/executable_path.cpp
#include "executable_path.h"
#include <filesystem>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <limits.h>
#include <unistd.h>
#endif

namespace treescout::core {

    std::string getExecutablePath() {
#ifdef _WIN32
        char path[MAX_PATH];
        if (GetModuleFileNameA(nullptr, path, MAX_PATH) == 0) {
            return "";
        }
        return std::string(path);
#else
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        return count != -1 ? std::string(result, count) : "";
#endif
    }

    std::string getExecutableDirectory() {
        std::string exec_path = getExecutablePath();
        if (exec_path.empty()) return "";
        return std::filesystem::path(exec_path).parent_path().string();
    }

}// namespace treescout::core
