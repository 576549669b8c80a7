#include "beach/cli.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

#include <gtest/gtest.h>

using Args = std::vector<std::string>;

static Args
ChrootArgs(const Args &args)
{
    auto parsed = Beach::Cli::parseChrootCommandLine(args);
    return parsed.config.buildInvocation(parsed.root, parsed.program, parsed.args).arguments;
}

/* writes a small profiles file, removed on destruction */
struct TempProfiles {
    std::filesystem::path path;

    TempProfiles()
        :path(std::filesystem::temp_directory_path() /
              ("beach-cli-" + std::to_string(getpid()) + ".yaml"))
    {
        std::ofstream file(path);
        file << "profiles:\n"
             << "  build:\n"
             << "    root: /srv/build\n"
             << "    user: builder\n"
             << "    groups: [wheel]\n"
             << "    program: make\n"
             << "    args: [all]\n";
    }

    ~TempProfiles() {
        std::filesystem::remove(path);
    }
};

TEST(CliTest, Positionals)
{
    auto parsed = Beach::Cli::parseChrootCommandLine({"/srv/root", "ls", "-l", "/"});
    ASSERT_EQ(parsed.root, "/srv/root");
    ASSERT_EQ(parsed.program, "ls");
    ASSERT_EQ(parsed.args, (Args{"-l", "/"}));
    ASSERT_EQ(parsed.config.buildInvocation(parsed.root, parsed.program, parsed.args).arguments,
              (Args{"chroot", "/srv/root", "ls", "-l", "/"}));
}

TEST(CliTest, OptionOrderDoesNotMatter)
{
    const Args expected{"chroot", "--skip-chdir", "--userspec=a:b", "--groups=x,y", "/r", "ls"};

    ASSERT_EQ(ChrootArgs({"--user", "a", "--group", "b", "--groups", "x,y", "--skip-chdir",
                          "/r", "ls"}),
              expected);
    ASSERT_EQ(ChrootArgs({"--skip-chdir", "--groups", "x,y", "--group", "b", "--user", "a",
                          "/r", "ls"}),
              expected);
}

TEST(CliTest, GroupsDropEmptyItems)
{
    ASSERT_EQ(ChrootArgs({"--groups", ",x,,y", "/r", "ls"}),
              (Args{"chroot", "--groups=x,y", "/r", "ls"}));

    /* nothing left means no flag */
    ASSERT_EQ(ChrootArgs({"--groups", ",,", "/r", "ls"}),
              (Args{"chroot", "/r", "ls"}));
}

TEST(CliTest, UserOverridesUserspec)
{
    ASSERT_EQ(ChrootArgs({"--userspec", "x:y", "/r", "ls"}),
              (Args{"chroot", "--userspec=x:y", "/r", "ls"}));
    ASSERT_EQ(ChrootArgs({"--user", "a", "--userspec", "x:y", "/r", "ls"}),
              (Args{"chroot", "--userspec=a", "/r", "ls"}));
    ASSERT_EQ(ChrootArgs({"--userspec", "x:y", "--user", "a", "--group", "b", "/r", "ls"}),
              (Args{"chroot", "--userspec=a:b", "/r", "ls"}));
}

TEST(CliTest, DoubleDashEndsOptions)
{
    auto parsed = Beach::Cli::parseChrootCommandLine({"--", "--skip-chdir", "ls"});
    ASSERT_FALSE(parsed.config.skipsChdir());
    ASSERT_EQ(parsed.root, "--skip-chdir");
    ASSERT_EQ(parsed.program, "ls");

    /* options after the first positional belong to the program */
    parsed = Beach::Cli::parseChrootCommandLine({"/r", "ls", "--user", "a"});
    ASSERT_FALSE(parsed.config.userSpec());
    ASSERT_EQ(parsed.args, (Args{"--user", "a"}));
}

TEST(CliTest, UsageErrors)
{
    using Beach::Cli::UsageError;

    ASSERT_THROW(Beach::Cli::parseChrootCommandLine({"--group", "b", "/r", "ls"}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseChrootCommandLine({"--bogus", "/r", "ls"}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseChrootCommandLine({"--user"}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseChrootCommandLine({"/r"}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseChrootCommandLine({}),
                 UsageError);

    ASSERT_THROW(Beach::Cli::parseProfileCommandLine({}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseProfileCommandLine({"edit", "x"}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseProfileCommandLine({"show"}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseProfileCommandLine({"list", "extra"}),
                 UsageError);
    ASSERT_THROW(Beach::Cli::parseProfileCommandLine({"list", "--config"}),
                 UsageError);
}

TEST(CliTest, ProfileCommandLine)
{
    auto parsed = Beach::Cli::parseProfileCommandLine({"run", "build", "--config", "/c.yaml",
                                                       "-j4", "--config", "x"});
    ASSERT_EQ(parsed.subCommand, "run");
    ASSERT_EQ(parsed.profileName, "build");
    ASSERT_EQ(parsed.configPath, "/c.yaml");
    ASSERT_EQ(parsed.extraArgs, (Args{"-j4", "--config", "x"}));

    parsed = Beach::Cli::parseProfileCommandLine({"list", "--config", "/c.yaml"});
    ASSERT_EQ(parsed.subCommand, "list");
    ASSERT_TRUE(parsed.profileName.empty());
    ASSERT_EQ(parsed.configPath, "/c.yaml");
}

TEST(CliTest, RunShow)
{
    std::ostringstream out;
    ASSERT_EQ(Beach::Cli::run({"show", "--user", "a", "--group", "b", "--groups", ",x,,y",
                               "--skip-chdir", "/r", "ls", "-l"}, out), 0);
    ASSERT_EQ(out.str(), "chroot --skip-chdir --userspec=a:b --groups=x,y /r ls -l\n");
}

TEST(CliTest, RunExitCodes)
{
    std::ostringstream out;

    ASSERT_EQ(Beach::Cli::run({}, out), 0);
    ASSERT_EQ(Beach::Cli::run({"help"}, out), 0);

    ASSERT_EQ(Beach::Cli::run({"show", "--group", "b", "/r", "ls"}, out),
              Beach::Cli::exitUsage);
    ASSERT_EQ(Beach::Cli::run({"frobnicate"}, out),
              Beach::Cli::exitUsage);

    /* stray arguments are a usage error even if the file is missing */
    ASSERT_EQ(Beach::Cli::run({"profile", "list", "--config", "/nonexistent/beach.yaml", "extra"}, out),
              Beach::Cli::exitUsage);

    ASSERT_EQ(Beach::Cli::run({"profile", "list", "--config", "/nonexistent/beach.yaml"}, out),
              Beach::Cli::exitFailure);
}

TEST(CliTest, RunProfile)
{
    TempProfiles profiles;
    const std::string config = profiles.path.string();

    std::ostringstream out;
    ASSERT_EQ(Beach::Cli::run({"profile", "list", "--config", config}, out), 0);
    ASSERT_EQ(out.str(), "build\t/srv/build\n");

    out.str("");
    ASSERT_EQ(Beach::Cli::run({"profile", "show", "build", "--config", config, "-j4"}, out), 0);
    ASSERT_EQ(out.str(), "chroot --userspec=builder --groups=wheel /srv/build make all -j4\n");

    ASSERT_EQ(Beach::Cli::run({"profile", "show", "missing", "--config", config}, out),
              Beach::Cli::exitFailure);
}
