#include "core_cli.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sys/wait.h>

namespace assetlock {

using json = nlohmann::json;

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.core");
    return l;
}

std::string describe(const std::vector<std::string>& command) {
    return command.empty() ? std::string("<empty>") : command.front();
}
} // namespace

std::string CommandRunner::call(const std::vector<std::string>& command) {
    CliResult result = run(command);
    if (!result.ok()) {
        throw AssetLockError(AssetLockError::ErrorType::NetworkError,
            describe(command) + " failed with exit code " + std::to_string(result.exit_code) +
            ". Output: " + result.output);
    }
    return result.output;
}

json CommandRunner::call_json(const std::vector<std::string>& command) {
    std::string output = call(command);
    try {
        return json::parse(output);
    } catch (const json::exception& e) {
        throw AssetLockError(AssetLockError::ErrorType::RPCError,
            "Failed to parse " + describe(command) + " response: " + e.what());
    }
}

CoreCli::CoreCli(std::string program, std::vector<std::string> base_args)
    : program_(std::move(program)), base_args_(std::move(base_args)) {}

// Execute a client command and capture what it prints. stderr is captured
// too, because that is where the client reports RPC errors.
CliResult CoreCli::run(const std::vector<std::string>& command) {
    std::string full_cmd = quote(program_);
    for (const auto& arg : base_args_) {
        full_cmd += " " + quote(arg);
    }
    for (const auto& arg : command) {
        full_cmd += " " + quote(arg);
    }
    full_cmd += " 2>&1";

    LOG_TRACE(logger(), "Running " << program_ << " " << describe(command));

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
    if (!pipe) {
        throw AssetLockError(AssetLockError::ErrorType::NetworkError,
            "Failed to execute " + program_ + ". Make sure it is installed and in your PATH.");
    }

    CliResult result;
    std::array<char, 256> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe.release());
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + WTERMSIG(status);
    }

    while (!result.output.empty() && (result.output.back() == '\n' || result.output.back() == '\r')) {
        result.output.pop_back();
    }

    if (!result.ok()) {
        result.rpc_error_code = parse_error_code(result.output);
        LOG_DEBUG(logger(), describe(command) << " exited with " << result.exit_code << ": " << result.output);
    }
    return result;
}

std::optional<int> CoreCli::parse_error_code(const std::string& output) {
    static const std::string marker = "error code:";
    auto pos = output.find(marker);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    const char* start = output.c_str() + pos + marker.size();
    char* end = nullptr;
    long code = std::strtol(start, &end, 10);
    if (end == start) {
        return std::nullopt;
    }
    return static_cast<int>(code);
}

// POSIX single quoting: ' becomes '\''
std::string CoreCli::quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace assetlock
