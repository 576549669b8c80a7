#include "beach/profile.hpp"
#include "beach/utils.hpp"

#include <yaml-cpp/yaml.h> // YAML parser for the profiles file
#include <cstdlib>         // std::getenv
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace Beach {

const char* const defaultProfilesPath = "/etc/beach/profiles.yaml";

namespace
{
    std::runtime_error profileError(const std::string& source,
                                    const std::string& profile,
                                    const std::string& what)
    {
        return std::runtime_error(source + ": profile '" + profile + "': " + what);
    }

    std::optional<std::string> optionalScalar(const YAML::Node& node, const char* key,
                                              const std::string& source,
                                              const std::string& profile)
    {
        const YAML::Node value = node[key];
        if (!value || value.IsNull()) {
            return std::nullopt;
        }
        if (!value.IsScalar()) {
            throw profileError(source, profile, std::string("'") + key + "' must be a string");
        }
        return value.as<std::string>();
    }

    std::vector<std::string> optionalList(const YAML::Node& node, const char* key,
                                          const std::string& source,
                                          const std::string& profile)
    {
        const YAML::Node value = node[key];
        if (!value || value.IsNull()) {
            return {};
        }
        if (!value.IsSequence()) {
            throw profileError(source, profile, std::string("'") + key + "' must be a list");
        }

        std::vector<std::string> items;
        for (const auto& item : value) {
            if (!item.IsScalar()) {
                throw profileError(source, profile,
                                   std::string("'") + key + "' may only contain strings");
            }
            items.push_back(item.as<std::string>());
        }
        return items;
    }

    Profile parseProfile(const std::string& name, const YAML::Node& node,
                         const std::string& source)
    {
        if (!node.IsMap()) {
            throw profileError(source, name, "expected a map of settings");
        }

        Profile profile;
        profile.name = name;

        auto root = optionalScalar(node, "root", source, name);
        if (!root || root->empty()) {
            throw profileError(source, name, "missing 'root'");
        }
        profile.root = *root;

        auto program = optionalScalar(node, "program", source, name);
        if (!program || program->empty()) {
            throw profileError(source, name, "missing 'program'");
        }
        profile.program = *program;

        profile.args = optionalList(node, "args", source, name);
        // Empty entries are dropped, as on the command line
        for (auto& group : optionalList(node, "groups", source, name)) {
            if (!group.empty()) {
                profile.groups.push_back(std::move(group));
            }
        }
        profile.user = optionalScalar(node, "user", source, name);
        profile.group = optionalScalar(node, "group", source, name);

        if (profile.group && !profile.user) {
            throw profileError(source, name, "'group' requires 'user'");
        }

        const YAML::Node skip = node["skip_chdir"];
        if (skip && !skip.IsNull()) {
            try {
                profile.skipChdir = skip.as<bool>();
            } catch (const YAML::Exception&) {
                throw profileError(source, name, "'skip_chdir' must be true or false");
            }
        }

        return profile;
    }
}

ChrootConfig Profile::toConfig() const
{
    ChrootConfig config;

    if (skipChdir) {
        config.skipChdir();
    }
    if (user && group) {
        config.userAndGroup(*user, *group);
    } else if (user) {
        config.user(*user);
    }
    config.groups(groups);

    return config;
}

Invocation Profile::toInvocation(const std::vector<std::string>& extraArgs) const
{
    std::vector<std::string> allArgs = args;
    allArgs.insert(allArgs.end(), extraArgs.begin(), extraArgs.end());
    return toConfig().buildInvocation(root, program, allArgs);
}

ProfileSet ProfileSet::loadFromFile(const std::string& path)
{
    if (!fs::exists(path)) {
        throw std::runtime_error("Profiles file not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse profiles file " + path + ": " + e.what());
    }

    return fromNode(root, path);
}

ProfileSet ProfileSet::loadFromString(const std::string& text)
{
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse profiles: ") + e.what());
    }

    return fromNode(root, "<string>");
}

ProfileSet ProfileSet::fromNode(const YAML::Node& root, const std::string& source)
{
    ProfileSet set;

    // An empty document has no profiles
    if (!root || root.IsNull()) {
        return set;
    }
    if (!root.IsMap()) {
        throw std::runtime_error(source + ": top level must be a map");
    }

    const YAML::Node profiles = root["profiles"];
    if (!profiles || profiles.IsNull()) {
        log_warning(source + ": no 'profiles' section");
        return set;
    }
    if (!profiles.IsMap()) {
        throw std::runtime_error(source + ": 'profiles' must be a map");
    }

    for (const auto& entry : profiles) {
        const std::string name = entry.first.as<std::string>();
        if (set.find(name) != nullptr) {
            throw profileError(source, name, "defined more than once");
        }
        set.profiles_.push_back(parseProfile(name, entry.second, source));
    }

    return set;
}

const Profile* ProfileSet::find(const std::string& name) const
{
    for (const auto& profile : profiles_) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

std::vector<std::string> ProfileSet::names() const
{
    std::vector<std::string> names;
    names.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        names.push_back(profile.name);
    }
    return names;
}

std::string resolveProfilesPath(const std::string& explicitPath)
{
    if (!explicitPath.empty()) {
        return explicitPath;
    }
    if (const char* env = std::getenv("BEACH_CONFIG"); env != nullptr && *env != '\0') {
        return env;
    }
    return defaultProfilesPath;
}

} // namespace Beach
