#ifndef BEACH_PROFILE_HPP
#define BEACH_PROFILE_HPP

#include "beach/chroot_config.hpp"

#include <string>
#include <vector>
#include <optional>

namespace YAML {
class Node;
}

namespace Beach {

/**
 * @brief Default location of the profiles file.
 */
extern const char* const defaultProfilesPath;

/**
 * @struct Profile
 * @brief A named chroot setup: which root, which identity, which program.
 */
struct Profile
{
    std::string name;
    std::string root;
    std::string program;
    std::vector<std::string> args;
    bool skipChdir = false;
    std::optional<std::string> user;
    std::optional<std::string> group;   // only meaningful together with user
    std::vector<std::string> groups;

    /**
     * @brief Builds the ChrootConfig described by this profile.
     */
    ChrootConfig toConfig() const;

    /**
     * @brief Builds the full invocation, appending `extraArgs` after the
     *        profile's own args.
     */
    Invocation toInvocation(const std::vector<std::string>& extraArgs = {}) const;
};

/**
 * @class ProfileSet
 * @brief The profiles read from a YAML configuration file.
 *
 * Expected layout:
 *
 *     profiles:
 *       <name>:
 *         root: <dir>
 *         program: <path>
 *         args: [..]          # optional
 *         skip_chdir: <bool>  # optional
 *         user: <user>        # optional
 *         group: <group>      # optional, requires user
 *         groups: [..]        # optional
 */
class ProfileSet
{
public:
    /**
     * @brief Loads profiles from a file on disk.
     * @param path Path to the YAML file.
     * @throws std::runtime_error if the file is missing, unreadable or malformed.
     */
    static ProfileSet loadFromFile(const std::string& path);

    /**
     * @brief Loads profiles from YAML text.
     * @throws std::runtime_error if the text is malformed.
     */
    static ProfileSet loadFromString(const std::string& text);

    /**
     * @brief Looks up a profile by name.
     * @return The profile, or nullptr if there is none by that name.
     */
    const Profile* find(const std::string& name) const;

    /**
     * @brief Profile names in the order they appear in the file.
     */
    std::vector<std::string> names() const;

    const std::vector<Profile>& profiles() const { return profiles_; }

private:
    static ProfileSet fromNode(const YAML::Node& root, const std::string& source);

    std::vector<Profile> profiles_;
};

/**
 * @brief Resolves the profiles path: an explicit path wins, then the
 *        BEACH_CONFIG environment variable, then defaultProfilesPath.
 */
std::string resolveProfilesPath(const std::string& explicitPath);

} // namespace Beach

#endif // BEACH_PROFILE_HPP
