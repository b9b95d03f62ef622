// src/core/executable_path.h
#pragma once
#include <string>

namespace treescout::core {

    // get the full path of the currently running executable
    std::string getExecutablePath();

    // get the directory of the currently running executable
    std::string getExecutableDirectory();

}// namespace treescout::core
