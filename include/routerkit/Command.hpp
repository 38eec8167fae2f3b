/**
 * @file Command.hpp
 * @brief External process execution
 *
 * CommandRunner is the seam between the cluster client and the operating
 * system. ProcessRunner spawns a real child process; tests substitute a
 * runner that records argv and replays canned output.
 */

#ifndef ROUTERKIT_COMMAND_HPP
#define ROUTERKIT_COMMAND_HPP

#include "routerkit/Value.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace routerkit {

/**
 * @brief Raw outcome of one child process
 */
struct ProcessOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

/**
 * @brief Outcome of one cluster CLI call
 *
 * - returncode != 0: stdout/stderr kept, results is an empty mapping
 * - returncode == 0 and JSON expected but undecodable: decode_error set,
 *   raw text kept in stdout_text
 */
struct CommandResult {
    int returncode = 0;
    Value results;
    std::string stdout_text;
    std::string stderr_text;
    std::string cmd;
    std::optional<std::string> decode_error;

    bool ok() const noexcept { return returncode == 0; }

    Value to_json() const;
};

/**
 * @brief Runs a command line to completion
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @param argv Program followed by its arguments (argv[0] is looked up on PATH)
     * @param env Variables added to the inherited environment
     * @throws CollaboratorError if the process cannot be spawned
     */
    virtual ProcessOutput run(const std::vector<std::string>& argv,
                              const std::map<std::string, std::string>& env) = 0;
};

/**
 * @brief fork/execvp runner capturing stdout and stderr
 *
 * stdin is /dev/null. An exec failure exits the child with 127; a child
 * killed by a signal reports 128 + signal number.
 */
class ProcessRunner : public CommandRunner {
public:
    ProcessOutput run(const std::vector<std::string>& argv,
                      const std::map<std::string, std::string>& env) override;
};

/**
 * @brief Join argv with spaces for diagnostics
 */
std::string join_command(const std::vector<std::string>& argv);

} // namespace routerkit

#endif // ROUTERKIT_COMMAND_HPP
