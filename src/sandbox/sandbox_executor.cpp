#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace reagent::sandbox {
namespace bp = boost::process;

namespace {

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool WaitUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds poll) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(poll);
    }
    return false;
}

}  // namespace

ExecResult SandboxExecutor::Run(const std::string& program,
                                const std::vector<std::string>& args,
                                const std::string& working_dir,
                                std::chrono::seconds timeout) {
    ExecResult result{};

    auto executable = program.find('/') == std::string::npos
        ? bp::search_path(program)
        : boost::filesystem::path(program);
    if (executable.empty()) {
        result.error = "program not found: " + program;
        return result;
    }

    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto stdout_path = std::filesystem::temp_directory_path() / ("reagent_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("reagent_stderr_" + stamp + ".log");

    try {
        bp::child child_process(
            executable,
            bp::args(args),
            bp::start_dir = working_dir,
            bp::std_in.close(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        int status = 0;
        const pid_t pid = child_process.id();
        bool finished = WaitUntil(pid, status, std::chrono::steady_clock::now() + timeout,
                                  std::chrono::milliseconds(100));
        if (!finished) {
            result.timed_out = true;
            utils::LogWarn("sandbox", "timeout after " + std::to_string(timeout.count()) +
                                          "s pid=" + std::to_string(pid));
            ::kill(pid, SIGTERM);
            finished = WaitUntil(pid, status, std::chrono::steady_clock::now() + std::chrono::seconds(2),
                                 std::chrono::milliseconds(100));
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        // Reaped by waitpid above; keep boost from waiting on it again.
        child_process.detach();

        if (result.timed_out) {
            result.exit_code = 124;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
        return result;
    }

    result.output = ReadAll(stdout_path);
    result.error = ReadAll(stderr_path);

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace reagent::sandbox
