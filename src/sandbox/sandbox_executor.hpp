#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace reagent::sandbox {

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

class SandboxExecutor {
public:
    // Runs program (resolved on PATH unless it contains a '/') with args in
    // working_dir. stdout and stderr are captured separately.
    static ExecResult Run(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& working_dir,
                          std::chrono::seconds timeout);
};

}  // namespace reagent::sandbox
