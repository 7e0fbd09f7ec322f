// cppcheck-suppress-file missingIncludeSystem
#include "command_runner.hpp"

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include "command_runner_test_hooks.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace hostscope {

namespace {

uid_t real_effective_uid()
{
    return ::geteuid();
}

CommandRunnerDeps make_default_deps()
{
    CommandRunnerDeps d;
    d.effective_uid = real_effective_uid;
    return d;
}

CommandRunnerDeps g_deps = make_default_deps();

std::string shell_quote(const std::string& arg)
{
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

bool is_executable_file(const std::string& path)
{
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

} // namespace

Result<std::string> find_executable(const std::string& name)
{
    if (name.empty()) {
        return Error(ErrorCode::InvalidArguments, "Empty executable name");
    }
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return name;
        }
        return Error(ErrorCode::ToolNotAvailable, "Executable not found", name);
    }

    const std::string path_env = env_or_default("PATH", "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin");
    for (const auto& dir : split(path_env, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return Error(ErrorCode::ToolNotAvailable, "Executable not found in PATH", name);
}

Result<CommandOutput> run_command(const std::string& executable, const std::vector<std::string>& args)
{
    std::string command = shell_quote(executable);
    for (const auto& arg : args) {
        command += " " + shell_quote(arg);
    }
    command += " 2>/dev/null";

    FILE* pipe = ::popen(command.c_str(), "r");
    if (pipe == nullptr) {
        return Error::system(errno, "Failed to launch command", executable);
    }

    CommandOutput output;
    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.stdout_text.append(buffer.data(), n);
    }

    const int status = ::pclose(pipe);
    if (status == -1) {
        return Error::system(errno, "Failed to wait for command", executable);
    }
    output.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (output.exit_code == 127) {
        return Error(ErrorCode::ToolNotAvailable, "Command could not be executed", executable);
    }

    logger().log(SLOG_DEBUG("External command finished")
                     .field("command", executable)
                     .field("exit_code", static_cast<int64_t>(output.exit_code))
                     .field("stdout_bytes", static_cast<uint64_t>(output.stdout_text.size())));
    return output;
}

bool running_as_root()
{
    return g_deps.effective_uid() == 0;
}

void set_command_runner_deps_for_test(const CommandRunnerDeps& deps)
{
    g_deps.effective_uid = deps.effective_uid ? deps.effective_uid : real_effective_uid;
}

void reset_command_runner_deps_for_test()
{
    g_deps = make_default_deps();
}

} // namespace hostscope
