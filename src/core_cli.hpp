#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace assetlock {

struct CliResult {
    int exit_code = 0;
    std::string output;                 // stdout and stderr, trailing newline removed
    std::optional<int> rpc_error_code;  // parsed from an "error code: N" line

    bool ok() const { return exit_code == 0; }
};

// Runs one node command. The node-backed services only depend on this
// interface, so they can be driven by a scripted runner in tests.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Throws AssetLockError(NetworkError) when the client cannot be started.
    // A command the node refuses is reported through the result.
    virtual CliResult run(const std::vector<std::string>& command) = 0;

    // run() that throws AssetLockError(NetworkError) unless the command
    // succeeded
    std::string call(const std::vector<std::string>& command);

    // call() with the output parsed as JSON; throws AssetLockError(RPCError)
    // on malformed output
    nlohmann::json call_json(const std::vector<std::string>& command);
};

// Wrapper around the node command line client (dash-cli). Every argument is
// shell-quoted, so raw transaction hex and JSON arrays pass through intact.
class CoreCli : public CommandRunner {
public:
    CoreCli(std::string program, std::vector<std::string> base_args);

    CliResult run(const std::vector<std::string>& command) override;

    // Extracts N from the client's "error code: N" line
    static std::optional<int> parse_error_code(const std::string& output);

    static std::string quote(const std::string& arg);

private:
    std::string program_;
    std::vector<std::string> base_args_;
};

} // namespace assetlock
