#include "beach/chroot_config.hpp"

#include <cstring>

#include <gtest/gtest.h>

TEST(InvocationTest, Argv)
{
    auto invocation = Beach::ChrootConfig().skipChdir()
        .buildInvocation("/r", "ls", {"-l"});

    auto argv = invocation.argv();
    ASSERT_EQ(argv.size(), invocation.arguments.size() + 1);
    ASSERT_STREQ(argv[0], "chroot");
    ASSERT_STREQ(argv[1], "--skip-chdir");
    ASSERT_STREQ(argv[2], "/r");
    ASSERT_STREQ(argv[3], "ls");
    ASSERT_STREQ(argv[4], "-l");
    ASSERT_EQ(argv[5], nullptr);
}

TEST(InvocationTest, ToString)
{
    auto invocation = Beach::ChrootConfig()
        .userAndGroup("nvzqz", "everyone")
        .groups({"wheel", "docker"})
        .buildInvocation("/path/to/root", "sh", {"-c", "echo it's here"});

    ASSERT_EQ(invocation.toString(),
              "chroot --userspec=nvzqz:everyone --groups=wheel,docker "
              "/path/to/root sh -c 'echo it'\\''s here'");
}

TEST(InvocationTest, Equality)
{
    auto a = Beach::ChrootConfig().user("u").buildInvocation("/r", "p");
    auto b = Beach::ChrootConfig().user("u").buildInvocation("/r", "p");
    auto c = Beach::ChrootConfig().user("v").buildInvocation("/r", "p");

    ASSERT_TRUE(a == b);
    ASSERT_FALSE(a != b);
    ASSERT_TRUE(a != c);
}
