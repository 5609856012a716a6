//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "daemonizer.hpp"

#include "io/io.hpp"
#include "netcfgd/platform/posix_utils.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <initializer_list>
#include <string>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace
{

constexpr const char* ReadyMarker = "netcfgd:ready";

}  // namespace

Daemonizer::Daemonizer(std::string pid_file_path)
    : pid_file_path_{std::move(pid_file_path)}
{
}

void Daemonizer::detach()
{
    closeInheritedFds();
    if (const int err = common::io::makePipe(status_pipe_))
    {
        fail("Failed to create status pipe: ", err);
    }

    if (!forkAndKeepChild())
    {
        waitForDaemonAndExit();
    }

    becomeSessionLeader();
    forkAgainAndExitParent();
    redirectStdioToDevNull();
    resetUmaskAndDir();
    lockPidFile();
}

void Daemonizer::reportReady()
{
    if (status_pipe_.write_end.get() >= 0)
    {
        (void) common::io::writeString(status_pipe_.write_end.get(), ReadyMarker);
        status_pipe_.write_end.reset();
    }
}

int Daemonizer::statusFd() const noexcept
{
    const int fd = status_pipe_.write_end.get();
    return (fd >= 0) ? fd : STDERR_FILENO;
}

void Daemonizer::fail(const char* const what, const int err) const
{
    std::string msg{what};
    msg += std::strerror(err);
    (void) common::io::writeString(statusFd(), msg);
    ::exit(EXIT_FAILURE);
}

void Daemonizer::closeInheritedFds()
{
    rlimit rlimit_files{};
    if (::getrlimit(RLIMIT_NOFILE, &rlimit_files) != 0)
    {
        fail("Failed to getrlimit(RLIMIT_NOFILE): ", errno);
    }
    // Standard input, output and error are kept (till `redirectStdioToDevNull`).
    for (int fd = STDERR_FILENO + 1; static_cast<rlim_t>(fd) < rlimit_files.rlim_cur; ++fd)
    {
        (void) ::close(fd);
    }
}

/// @return `true` in the child process.
///
bool Daemonizer::forkAndKeepChild()
{
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        fail("Failed to fork: ", errno);
    }

    if (pid == 0)
    {
        status_pipe_.read_end.reset();
        return true;
    }
    status_pipe_.write_end.reset();
    return false;
}

void Daemonizer::becomeSessionLeader() const
{
    if (::setsid() < 0)
    {
        fail("Failed to setsid: ", errno);
    }
}

void Daemonizer::forkAgainAndExitParent()
{
    // The second fork makes sure that the daemon can never reacquire a controlling terminal.
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        fail("Failed to fork again: ", errno);
    }
    if (pid > 0)
    {
        ::_exit(EXIT_SUCCESS);
    }
}

void Daemonizer::redirectStdioToDevNull() const
{
    common::io::OwnFd dev_null{::open("/dev/null", O_RDWR)};  // NOLINT *-vararg
    if (dev_null.get() < 0)
    {
        fail("Failed to open(/dev/null): ", errno);
    }

    for (const int std_fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO})
    {
        if (::dup2(dev_null.get(), std_fd) < 0)
        {
            fail("Failed to dup2(/dev/null): ", errno);
        }
    }
    if (dev_null.get() <= STDERR_FILENO)
    {
        (void) dev_null.release();
    }
}

void Daemonizer::resetUmaskAndDir() const
{
    ::umask(0);
    if (::chdir("/") != 0)
    {
        fail("Failed to chdir(/): ", errno);
    }
}

void Daemonizer::lockPidFile()
{
    pid_file_ = common::io::OwnFd{::open(pid_file_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};  // NOLINT
    if (pid_file_.get() < 0)
    {
        fail("Failed to open PID file: ", errno);
    }

    // The lock is held (and the file is kept open) while the daemon is alive,
    // so a second instance fails here.
    if (::lockf(pid_file_.get(), F_TLOCK, 0) != 0)
    {
        fail("Failed to lock PID file (is another instance running?): ", errno);
    }
    if (::ftruncate(pid_file_.get(), 0) != 0)
    {
        fail("Failed to truncate PID file: ", errno);
    }
    if (const int err = common::io::writeString(pid_file_.get(), std::to_string(::getpid()) + "\n"))
    {
        fail("Failed to write PID file: ", err);
    }
}

void Daemonizer::waitForDaemonAndExit()
{
    std::string report;

    constexpr std::size_t        chunk_size = 256;
    std::array<char, chunk_size> chunk{};
    while (true)
    {
        ssize_t bytes_read = 0;
        if (const int err = platform::posixSyscallInto(bytes_read, [this, &chunk] {
                //
                return ::read(status_pipe_.read_end.get(), chunk.data(), chunk.size());
            }))
        {
            (void) std::fprintf(stderr, "Failed to read status pipe: %s\n", std::strerror(err));  // NOLINT *-vararg
            ::exit(EXIT_FAILURE);
        }
        if (bytes_read == 0)
        {
            break;
        }
        report.append(chunk.data(), static_cast<std::size_t>(bytes_read));
    }

    // The pipe is closed by the daemon (either explicitly on readiness, or implicitly on its exit).
    if (report != ReadyMarker)
    {
        const auto reason = report.empty() ? std::string{"daemon exited unexpectedly"} : report;
        (void) std::fprintf(stderr, "Daemon init failed: %s\n", reason.c_str());  // NOLINT *-vararg
        ::exit(EXIT_FAILURE);
    }
    ::exit(EXIT_SUCCESS);
}

}  // namespace daemon
}  // namespace netcfgd
