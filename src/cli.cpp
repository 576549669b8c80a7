#include "beach/cli.hpp"
#include "beach/launcher.hpp"
#include "beach/profile.hpp"
#include "beach/utils.hpp"

#include <iostream>
#include <optional>
#include <exception>
#include <unistd.h> // geteuid

namespace Beach {
namespace Cli {

namespace
{
    const char* const chrootUsage = " [options] <root> <program> [args...]";

    const char* const profileUsage =
        "Usage: beach profile <subcommand>\n"
        "  list [--config <path>]                 List profiles\n"
        "  show <name> [--config <path>]          Print a profile's command line\n"
        "  run <name> [--config <path>] [args]    Run a profile\n";

    int launch(const Invocation& invocation)
    {
        if (geteuid() != 0) {
            log_warning("Not running as root; chroot(1) will most likely refuse.");
        }
        return Launcher::run(invocation);
    }

    int runProfileCommand(const ProfileCommandLine& commandLine, std::ostream& out)
    {
        ProfileSet profiles =
            ProfileSet::loadFromFile(resolveProfilesPath(commandLine.configPath));

        if (commandLine.subCommand == "list") {
            for (const auto& profile : profiles.profiles()) {
                out << profile.name << "\t" << profile.root << "\n";
            }
            return 0;
        }

        const Profile* profile = profiles.find(commandLine.profileName);
        if (profile == nullptr) {
            log_error("No such profile: " + commandLine.profileName);
            return exitFailure;
        }

        Invocation invocation = profile->toInvocation(commandLine.extraArgs);
        if (commandLine.subCommand == "show") {
            out << invocation.toString() << "\n";
            return 0;
        }
        return launch(invocation);
    }
}

ChrootCommandLine parseChrootCommandLine(const std::vector<std::string>& args)
{
    ChrootCommandLine parsed;
    std::optional<std::string> user;
    std::optional<std::string> group;
    std::vector<std::string> positionals;
    bool optionsDone = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        // Everything from the first positional on belongs to root/program/args
        if (optionsDone || !positionals.empty() || arg.empty() || arg[0] != '-') {
            positionals.push_back(arg);
            continue;
        }

        if (arg == "--") {
            optionsDone = true;
            continue;
        }
        if (arg == "--skip-chdir") {
            parsed.config.skipChdir();
            continue;
        }
        if (arg != "--user" && arg != "--group" && arg != "--userspec" && arg != "--groups") {
            throw UsageError("Unknown option '" + arg + "'.");
        }
        if (i + 1 >= args.size()) {
            throw UsageError(arg + " requires an argument.");
        }

        const std::string& value = args[++i];
        if (arg == "--user") {
            user = value;
        }
        else if (arg == "--group") {
            group = value;
        }
        else if (arg == "--userspec") {
            parsed.config.user(value);
        }
        else {
            parsed.config.groups(splitList(value, ','));
        }
    }

    if (group && !user) {
        throw UsageError("--group requires --user.");
    }
    if (user && group) {
        parsed.config.userAndGroup(*user, *group);
    }
    else if (user) {
        parsed.config.user(*user);
    }

    if (positionals.size() < 2) {
        throw UsageError("Expected <root> and <program>.");
    }

    parsed.root = positionals[0];
    parsed.program = positionals[1];
    parsed.args.assign(positionals.begin() + 2, positionals.end());
    return parsed;
}

ProfileCommandLine parseProfileCommandLine(const std::vector<std::string>& args)
{
    if (args.empty()) {
        throw UsageError("Missing subcommand for 'profile'.");
    }

    ProfileCommandLine parsed;
    parsed.subCommand = args[0];
    if (parsed.subCommand != "list" && parsed.subCommand != "show" && parsed.subCommand != "run") {
        throw UsageError("Unknown or invalid subcommand for 'profile': " + parsed.subCommand);
    }

    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];
        // "--config" after the program arguments belongs to the program
        if (arg == "--config" && parsed.extraArgs.empty()) {
            if (i + 1 >= args.size()) {
                throw UsageError("--config requires a file argument.");
            }
            parsed.configPath = args[++i];
        }
        else if (parsed.profileName.empty() && parsed.subCommand != "list") {
            parsed.profileName = arg;
        }
        else {
            parsed.extraArgs.push_back(arg);
        }
    }

    if (parsed.subCommand == "list" && !parsed.extraArgs.empty()) {
        throw UsageError("'profile list' takes no arguments.");
    }
    if (parsed.subCommand != "list" && parsed.profileName.empty()) {
        throw UsageError("Missing profile name for 'profile " + parsed.subCommand + "'.");
    }

    return parsed;
}

void printHelp(std::ostream& out)
{
    out << "Beach 0.1\n"
        << "Usage: beach <command> [options] ...\n\n"
        << "Beach runs programs under an alternate root filesystem through chroot(1),\n"
        << "optionally as a different user and group.\n\n"
        << "Commands:\n"
        << "  run  [options] <root> <program> [args...]   Run a program inside <root>\n"
        << "  show [options] <root> <program> [args...]   Print the chroot command line\n"
        << "  profile list [--config <path>]               List configured profiles\n"
        << "  profile show <name> [--config <path>]        Print a profile's command line\n"
        << "  profile run <name> [--config <path>] [args]  Run a profile\n"
        << "  help                                         Show this message\n\n"
        << "Options:\n"
        << "  --skip-chdir             Do not change directory to the new root\n"
        << "  --user <user>            Run as <user>\n"
        << "  --group <group>          Run with primary group <group> (needs --user)\n"
        << "  --userspec <user[:grp]>  Same as --user/--group in one argument\n"
        << "  --groups <g1,g2,...>     Supplementary groups\n"
        << "  --                       End of options\n\n"
        << "The profiles file defaults to " << defaultProfilesPath
        << " or $BEACH_CONFIG.\n";
}

int run(const std::vector<std::string>& args, std::ostream& out)
{
    // If no command is supplied, show the help message
    if (args.empty()) {
        printHelp(out);
        return 0;
    }

    const std::string& command = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        // -------------------------------------------------------------
        // Run / Show Commands
        // -------------------------------------------------------------
        if (command == "run" || command == "show") {
            ChrootCommandLine parsed;
            try {
                parsed = parseChrootCommandLine(rest);
            } catch (const UsageError& e) {
                std::cerr << "Error: " << e.what() << "\n"
                          << "Usage: beach " << command << chrootUsage << "\n";
                return exitUsage;
            }

            Invocation invocation =
                parsed.config.buildInvocation(parsed.root, parsed.program, parsed.args);

            if (command == "show") {
                out << invocation.toString() << "\n";
                return 0;
            }
            return launch(invocation);
        }
        // -------------------------------------------------------------
        // Profile Command
        // -------------------------------------------------------------
        else if (command == "profile") {
            ProfileCommandLine parsed;
            try {
                parsed = parseProfileCommandLine(rest);
            } catch (const UsageError& e) {
                std::cerr << "Error: " << e.what() << "\n" << profileUsage;
                return exitUsage;
            }
            return runProfileCommand(parsed, out);
        }
        // -------------------------------------------------------------
        // Help Command
        // -------------------------------------------------------------
        else if (command == "help" || command == "--help" || command == "-h") {
            printHelp(out);
            return 0;
        }
    } catch (const std::exception& e) {
        log_error(e.what());
        return exitFailure;
    }

    std::cerr << "Unknown command: " << command << "\n";
    return exitUsage;
}

} // namespace Cli
} // namespace Beach
