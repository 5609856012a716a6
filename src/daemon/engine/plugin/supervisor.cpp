//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "supervisor.hpp"

#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <dirent.h>
#include <signal.h>  // NOLINT(*-deprecated-headers)
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace plugin
{

constexpr const char* Supervisor::ExecutablePrefix;

Supervisor::Supervisor(libcyphal::IExecutor& executor, Settings settings)
    : executor_{executor}
    , settings_{std::move(settings)}
{
}

Supervisor::~Supervisor()
{
    stop();
}

int Supervisor::start()
{
    const auto paths = findPlugins(settings_.directory);
    logger_->info("Found {} plugin(s) in '{}'.", paths.size(), settings_.directory);

    for (const auto& path : paths)
    {
        children_.push_back(Child{path, -1, {}});
    }
    for (auto& child : children_)
    {
        spawn(child);
    }

    poll_callback_ = executor_.registerCallback([this](const auto& arg) {
        //
        poll(arg.approx_now);
    });
    const bool is_scheduled = poll_callback_.schedule(
        libcyphal::IExecutor::Callback::Schedule::Repeat{executor_.now() + settings_.poll_period,
                                                        settings_.poll_period});
    if (!is_scheduled)
    {
        logger_->error("Failed to schedule plugin polling.");
        return EINVAL;
    }
    return 0;
}

void Supervisor::stop()
{
    is_stopping_ = true;
    poll_callback_.reset();

    for (auto& child : children_)
    {
        if (child.pid > 0)
        {
            logger_->debug("Terminating plugin (pid={}, path='{}').", child.pid, child.path);
            if (::kill(child.pid, SIGTERM) != 0)
            {
                const int err = errno;
                logger_->warn("Failed to terminate plugin (pid={}, err={}).", child.pid, err);
            }
            int status = 0;
            (void) ::waitpid(child.pid, &status, WNOHANG);
            child.pid = -1;
        }
    }
}

std::vector<std::string> Supervisor::findPlugins(const std::string& directory)
{
    std::vector<std::string> paths;

    DIR* const dir = ::opendir(directory.c_str());
    if (dir == nullptr)
    {
        const int err = errno;
        common::getLogger(common::logger_names::Plugin)
            ->warn("Can't open plugin directory '{}' (err={}).", directory, err);
        return paths;
    }

    const std::string prefix{ExecutablePrefix};
    while (const auto* const entry = ::readdir(dir))
    {
        const std::string name{entry->d_name};
        if ((name.size() <= prefix.size()) || (0 != name.compare(0, prefix.size(), prefix)))
        {
            continue;
        }

        auto        path = directory + "/" + name;
        struct stat st{};
        if ((::stat(path.c_str(), &st) == 0) && S_ISREG(st.st_mode) && (::access(path.c_str(), X_OK) == 0))
        {
            paths.push_back(std::move(path));
        }
    }
    (void) ::closedir(dir);

    std::sort(paths.begin(), paths.end());
    return paths;
}

void Supervisor::spawn(Child& child)
{
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int err = errno;
        logger_->error("Failed to fork plugin '{}' (err={}).", child.path, err);
        child.restart_at = executor_.now() + settings_.restart_delay;
        return;
    }

    if (pid == 0)
    {
        // Child process.
        std::vector<char> path{child.path.cbegin(), child.path.cend()};
        path.push_back('\0');
        std::vector<char> connection{settings_.connection.cbegin(), settings_.connection.cend()};
        connection.push_back('\0');

        char* const argv[] = {path.data(), connection.data(), nullptr};
        ::execv(path.data(), argv);
        ::_exit(127);  // NOLINT
    }

    child.pid = pid;
    logger_->info("Plugin is spawned (pid={}, path='{}').", pid, child.path);
}

void Supervisor::poll(const libcyphal::TimePoint now)
{
    for (auto& child : children_)
    {
        if (child.pid > 0)
        {
            int         status = 0;
            const pid_t result = ::waitpid(child.pid, &status, WNOHANG);
            if (result == 0)
            {
                continue;
            }
            if (result < 0)
            {
                const int err = errno;
                logger_->warn("Failed to wait for plugin (pid={}, err={}).", child.pid, err);
            }
            else if (WIFEXITED(status))
            {
                logger_->warn("Plugin has exited (pid={}, status={}, path='{}').",
                              child.pid,
                              WEXITSTATUS(status),
                              child.path);
            }
            else if (WIFSIGNALED(status))
            {
                logger_->warn("Plugin was killed (pid={}, signal={}, path='{}').",
                              child.pid,
                              WTERMSIG(status),
                              child.path);
            }
            child.pid        = -1;
            child.restart_at = now + settings_.restart_delay;
            continue;
        }

        if (!is_stopping_ && (now >= child.restart_at))
        {
            logger_->info("Restarting plugin '{}'.", child.path);
            spawn(child);
        }
    }
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
