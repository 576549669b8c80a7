#ifndef BEACH_CLI_HPP
#define BEACH_CLI_HPP

#include "beach/chroot_config.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Beach {
namespace Cli {

constexpr int exitFailure = 1;
constexpr int exitUsage = 2;

/**
 * @brief Thrown for malformed command lines; reported with exit code 2.
 */
class UsageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct ChrootCommandLine
 * @brief Result of parsing "[options] <root> <program> [args...]".
 */
struct ChrootCommandLine
{
    ChrootConfig config;
    std::string root;
    std::string program;
    std::vector<std::string> args;
};

/**
 * @struct ProfileCommandLine
 * @brief Result of parsing "<list|show|run> [name] [--config <path>] [args...]".
 */
struct ProfileCommandLine
{
    std::string subCommand;
    std::string configPath;
    std::string profileName;
    std::vector<std::string> extraArgs;
};

/**
 * @brief Parses the arguments of `beach run` / `beach show`.
 *
 * Options stop at the first positional or at "--". `--user`/`--group` are
 * combined after parsing and take precedence over `--userspec`.
 *
 * @param args The arguments following the command name.
 * @throws UsageError on an unknown option, a missing option value,
 *         `--group` without `--user`, or a missing root/program.
 */
ChrootCommandLine parseChrootCommandLine(const std::vector<std::string>& args);

/**
 * @brief Parses the arguments of `beach profile`.
 *
 * @param args The arguments following "profile".
 * @throws UsageError on an unknown subcommand or missing/stray arguments.
 */
ProfileCommandLine parseProfileCommandLine(const std::vector<std::string>& args);

/**
 * @brief Prints the top-level help text.
 */
void printHelp(std::ostream& out);

/**
 * @brief Runs a whole `beach` command line.
 *
 * @param args Command line without the program name.
 * @param out  Where command output (help, show, profile list) is written.
 * @return The process exit status: the launched program's status for `run`,
 *         exitUsage for usage errors, exitFailure for configuration errors.
 */
int run(const std::vector<std::string>& args, std::ostream& out);

} // namespace Cli
} // namespace Beach

#endif // BEACH_CLI_HPP
