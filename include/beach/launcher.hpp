#ifndef BEACH_LAUNCHER_HPP
#define BEACH_LAUNCHER_HPP

#include "beach/chroot_config.hpp"

namespace Beach {
namespace Launcher {

/**
 * @brief Exit code reported when the program could not be found.
 */
constexpr int exitNotFound = 127;

/**
 * @brief Exit code reported when the program was found but could not be executed.
 */
constexpr int exitCannotExecute = 126;

/**
 * @brief Runs an invocation as a child process and waits for it.
 *
 * @param invocation The program (looked up on PATH) and its full argv.
 * @return The child's exit code, or 128 + signal number if it was killed.
 *         127 / 126 if the program could not be found / executed.
 *
 * @throws std::invalid_argument if the invocation has an empty argv.
 * @throws std::system_error if fork() or waitpid() fails.
 *
 * @note Running chroot(1) requires superuser privileges; this is enforced by
 *       the operating system, not checked here.
 */
int run(const Invocation& invocation);

} // namespace Launcher
} // namespace Beach

#endif // BEACH_LAUNCHER_HPP
