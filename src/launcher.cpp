#include "beach/launcher.hpp"
#include "beach/utils.hpp"

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <system_error>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // fork, execvp, _exit
#include <errno.h>
#include <cstring>     // strerror

namespace Beach {
namespace Launcher {

    int run(const Invocation& invocation)
    {
        if (invocation.arguments.empty()) {
            throw std::invalid_argument("Invocation of '" + invocation.program + "' has no arguments");
        }

        log_message("Running: " + invocation.toString());

        // Build argv before forking so the child does not allocate
        std::vector<char*> argv = invocation.argv();

        pid_t pid = fork();
        if (pid < 0) {
            throw std::system_error(errno, std::system_category(), "Fork failed");
        }

        // --- Child Process ---
        if (pid == 0) {
            execvp(invocation.program.c_str(), argv.data());

            // If execvp returns, an error occurred
            int execError = errno;
            std::cerr << "execvp failed for command: " << invocation.program
                      << ": " << strerror(execError) << std::endl;
            _exit(execError == ENOENT ? exitNotFound : exitCannotExecute);
        }

        // --- Parent Process ---
        int status = 0;
        pid_t waitedPid;
        do {
            waitedPid = waitpid(pid, &status, 0);
        } while (waitedPid < 0 && errno == EINTR);

        if (waitedPid < 0) {
            throw std::system_error(errno, std::system_category(), "waitpid failed");
        }

        if (WIFEXITED(status)) {
            int exitCode = WEXITSTATUS(status);
            if (exitCode != 0) {
                log_warning(invocation.program + " exited with code " + std::to_string(exitCode));
            }
            return exitCode;
        }

        if (WIFSIGNALED(status)) {
            int signal = WTERMSIG(status);
            log_error(invocation.program + " terminated by signal: " + std::to_string(signal));
            return 128 + signal;
        }

        log_error(invocation.program + " finished with unknown status.");
        return 1;
    }

} // namespace Launcher
} // namespace Beach
