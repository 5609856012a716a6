//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_DAEMONIZER_HPP_INCLUDED
#define NETCFGD_DAEMON_DAEMONIZER_HPP_INCLUDED

#include "io/io.hpp"

#include <string>

namespace netcfgd
{
namespace daemon
{

/// Turns the current process into a SysV daemon (see `man 7 daemon`).
///
/// The process which started the daemon waits until the daemon reports its startup outcome
/// (through an anonymous pipe), and only then exits - with success if the daemon is ready,
/// or with failure (printing the reported reason to its standard error output) otherwise.
///
class Daemonizer final
{
public:
    explicit Daemonizer(std::string pid_file_path);

    Daemonizer(const Daemonizer&)                = delete;
    Daemonizer(Daemonizer&&) noexcept            = delete;
    Daemonizer& operator=(const Daemonizer&)     = delete;
    Daemonizer& operator=(Daemonizer&&) noexcept = delete;

    ~Daemonizer() = default;

    /// Detaches from the controlling terminal.
    ///
    /// Returns only in the final daemon process; the original and the intermediate processes exit.
    ///
    void detach();

    /// Notifies the original process that the daemon has been successfully initialized.
    ///
    void reportReady();

    /// File descriptor where startup failures should be reported to.
    ///
    /// Before `detach` (and after `reportReady`) it is the standard error output.
    ///
    int statusFd() const noexcept;

    /// Reports the failure (with `strerror` of the given error code) and exits the process.
    ///
    [[noreturn]] void fail(const char* const what, const int err) const;

private:
    void closeInheritedFds();
    bool forkAndKeepChild();
    void becomeSessionLeader() const;
    void forkAgainAndExitParent();
    void redirectStdioToDevNull() const;
    void resetUmaskAndDir() const;
    void lockPidFile();
    [[noreturn]] void waitForDaemonAndExit();

    const std::string pid_file_path_;
    common::io::OwnPipe       status_pipe_;
    common::io::OwnFd         pid_file_;

};  // Daemonizer

}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_DAEMONIZER_HPP_INCLUDED
