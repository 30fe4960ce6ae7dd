/**
 * @file process.hpp
 * @brief Run an external command with captured output and a deadline.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace game_factory {

struct CommandOutput {
    int exit_code{-1};
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

/**
 * @brief fork/exec @p argv, collecting stdout and stderr.
 *
 * argv[0] is resolved through PATH. The child is killed with SIGKILL once
 * @p timeout_ms elapses. A non-zero exit status is not an error here; the
 * caller inspects CommandOutput::exit_code. Errors are reserved for spawn
 * failures and timeouts (ErrorCode::RuntimeUnavailable).
 */
Result<CommandOutput> run_command(const std::vector<std::string>& argv, uint32_t timeout_ms);

}  // namespace game_factory
