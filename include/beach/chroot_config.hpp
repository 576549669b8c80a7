#ifndef BEACH_CHROOT_CONFIG_HPP
#define BEACH_CHROOT_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace Beach {

/**
 * @struct Invocation
 * @brief A program name and its complete argument list (argv[0] included),
 *        ready to be handed to a process launcher.
 */
struct Invocation
{
    std::string program;
    std::vector<std::string> arguments;

    /**
     * @brief Builds a NUL-terminated argv suitable for execvp().
     *
     * The returned pointers refer into `arguments` and stay valid as long as
     * this Invocation is alive and unmodified.
     */
    std::vector<char*> argv() const;

    /**
     * @brief Renders the arguments as a shell-quoted command line.
     */
    std::string toString() const;

    bool operator==(const Invocation& other) const;
    bool operator!=(const Invocation& other) const;
};

/**
 * @class ChrootConfig
 * @brief Accumulates options for chroot(1) and turns them into an Invocation.
 *
 * Every setter returns the config itself so calls can be chained:
 *
 *     Beach::ChrootConfig()
 *         .skipChdir()
 *         .userAndGroup("nvzqz", "everyone")
 *         .groups({"wheel", "docker"})
 *         .buildInvocation("/path/to/root", "ls", {"/"});
 *
 * Nothing is validated here. A missing root, an unknown user or group and
 * insufficient privilege are all reported by chroot(1) when the invocation
 * is actually run.
 */
class ChrootConfig
{
public:
    ChrootConfig() = default;

    /**
     * @brief Do not change the working directory to the new root.
     */
    ChrootConfig& skipChdir();

    /**
     * @brief Runs the program as `user`. Replaces any earlier user spec.
     */
    ChrootConfig& user(const std::string& user);

    /**
     * @brief Runs the program as `user:group`. Replaces any earlier user spec.
     */
    ChrootConfig& userAndGroup(const std::string& user, const std::string& group);

    /**
     * @brief Sets the supplementary groups.
     *
     * An empty list leaves the configuration untouched. A non-empty list
     * replaces the previous one; order and duplicates are kept.
     */
    ChrootConfig& groups(const std::vector<std::string>& groups);

    /**
     * @brief Produces the chroot(1) invocation for running `program` under `root`.
     *
     * @param root      The directory that becomes `/`, passed through verbatim.
     * @param program   The program to run inside the new root.
     * @param extraArgs Arguments for `program`, in order.
     * @return The invocation: "chroot", flags, root, program, extraArgs.
     */
    Invocation buildInvocation(const std::filesystem::path& root,
                               const std::string& program,
                               const std::vector<std::string>& extraArgs = {}) const;

    bool skipsChdir() const { return skipChdir_; }
    const std::optional<std::string>& userSpec() const { return userSpec_; }
    const std::optional<std::vector<std::string>>& supplementaryGroups() const { return groups_; }

private:
    bool skipChdir_ = false;
    std::optional<std::string> userSpec_;
    std::optional<std::vector<std::string>> groups_;
};

} // namespace Beach

#endif // BEACH_CHROOT_CONFIG_HPP
