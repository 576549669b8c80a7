#include "beach/chroot_config.hpp"
#include "beach/utils.hpp"

namespace Beach {

// Name looked up on PATH by the launcher
static const char* const chrootProgram = "chroot";

std::vector<char*> Invocation::argv() const
{
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (const auto& arg : arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

std::string Invocation::toString() const
{
    std::vector<std::string> quoted;
    quoted.reserve(arguments.size());
    for (const auto& arg : arguments) {
        quoted.push_back(shellQuote(arg));
    }
    return joinList(quoted, " ");
}

bool Invocation::operator==(const Invocation& other) const
{
    return program == other.program && arguments == other.arguments;
}

bool Invocation::operator!=(const Invocation& other) const
{
    return !(*this == other);
}

ChrootConfig& ChrootConfig::skipChdir()
{
    skipChdir_ = true;
    return *this;
}

ChrootConfig& ChrootConfig::user(const std::string& user)
{
    userSpec_ = user;
    return *this;
}

ChrootConfig& ChrootConfig::userAndGroup(const std::string& user, const std::string& group)
{
    userSpec_ = user + ":" + group;
    return *this;
}

ChrootConfig& ChrootConfig::groups(const std::vector<std::string>& groups)
{
    // "--groups=" with nothing after it means nothing to chroot(1)
    if (!groups.empty()) {
        groups_ = groups;
    }
    return *this;
}

Invocation ChrootConfig::buildInvocation(const std::filesystem::path& root,
                                         const std::string& program,
                                         const std::vector<std::string>& extraArgs) const
{
    Invocation invocation;
    invocation.program = chrootProgram;

    auto& args = invocation.arguments;
    args.reserve(extraArgs.size() + 6);
    args.emplace_back(chrootProgram);

    if (skipChdir_) {
        args.emplace_back("--skip-chdir");
    }
    if (userSpec_) {
        args.push_back("--userspec=" + *userSpec_);
    }
    if (groups_) {
        args.push_back("--groups=" + joinList(*groups_, ","));
    }

    args.push_back(root.string());
    args.push_back(program);
    args.insert(args.end(), extraArgs.begin(), extraArgs.end());

    return invocation;
}

} // namespace Beach
