/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <string>
#include <vector>

namespace romc::proc {
struct ProcessResult {
    // False when the program could not be started at all (missing binary, spawn failure).
    bool launched = false;
    int exit_code = -1;
    std::string out;
    std::string err;
    std::string launch_error;
};

// Runs argv[0] (searched on PATH) and blocks until it exits. stdout and stderr are captured
// separately. No timeout is applied.
ProcessResult run_process(const std::vector<std::string>& argv);
}  // namespace romc::proc
