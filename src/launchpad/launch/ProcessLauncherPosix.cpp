// src/launchpad/launch/ProcessLauncherPosix.cpp
//
// POSIX process launcher: double fork so the launched program is re-parented
// to init and never becomes our zombie. Failures after the fork are reported
// back through a close-on-exec pipe as a (stage, errno) pair.

#include "launchpad/launch/ProcessLauncher.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace launchpad::launch {

namespace {

enum class ChildStage : int { Fork = 1, Chdir = 2, Exec = 3 };

struct ChildFailure {
    ChildStage stage;
    int        err;
};

void ReportFailure(int fd, ChildStage stage, int err) noexcept
{
    const ChildFailure f{stage, err};
    ssize_t n;
    do {
        n = ::write(fd, &f, sizeof(f));
    } while (n < 0 && errno == EINTR);
}

std::string DescribeFailure(const ChildFailure& f, const std::string& program, const char* workDir)
{
    const std::string reason = std::strerror(f.err);
    switch (f.stage) {
    case ChildStage::Fork:  return "cannot fork for " + program + ": " + reason;
    case ChildStage::Chdir: return "cannot enter working directory " + std::string(workDir ? workDir : "") + ": " + reason;
    case ChildStage::Exec:  break;
    }
    return "cannot start " + program + ": " + reason;
}

} // namespace

std::expected<void, LaunchError> SystemProcessLauncher::launch(const ExecutionPlan& plan)
{
    const std::vector<std::string> args = BuildPosixArgv(plan, m_options.terminal);
    if (args.empty() || args.front().empty())
        return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed, "empty command"});

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const char* workDir = plan.workingDir.empty() ? nullptr : plan.workingDir.c_str();

    int fds[2];
    if (::pipe(fds) != 0)
    {
        const int err = errno;
        return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed,
                                           std::string("pipe failed: ") + std::strerror(err)});
    }
    if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0)
    {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed,
                                           std::string("fcntl failed: ") + std::strerror(err)});
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed,
                                           std::string("fork failed: ") + std::strerror(err)});
    }

    if (pid == 0)
    {
        ::close(fds[0]);
        const pid_t grandchild = ::fork();
        if (grandchild < 0)
        {
            ReportFailure(fds[1], ChildStage::Fork, errno);
            ::_exit(1);
        }
        if (grandchild > 0)
            ::_exit(0);

        ::setsid();
        if (workDir && ::chdir(workDir) != 0)
        {
            ReportFailure(fds[1], ChildStage::Chdir, errno);
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        ReportFailure(fds[1], ChildStage::Exec, errno);
        ::_exit(127);
    }

    ::close(fds[1]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(fds[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(failure)))
    {
        std::string message = DescribeFailure(failure, args.front(), workDir);
        spdlog::error("Launch: {}", message);
        return std::unexpected(LaunchError{LaunchError::Code::SpawnFailed, std::move(message)});
    }

    spdlog::info("Launch: started {} plan '{}' in {}", PlanKindName(plan.kind), plan.program,
                 plan.workingDir.empty() ? std::string(".") : plan.workingDir);
    return {};
}

} // namespace launchpad::launch
