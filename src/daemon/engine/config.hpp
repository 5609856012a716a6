//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{

/// Read-only daemon configuration.
///
/// Every getter falls back to its default when the key is missing (or has unexpected type).
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    struct Defaults
    {
        static constexpr const char*  IpcConnection         = "unix:/run/netcfgd/netcfgd.sock";
        static constexpr std::size_t  MaxRequestSize        = 1048576;  // NOLINT(*-magic-numbers)
        static constexpr std::size_t  MaxConcurrentRequests = 8;
        static constexpr std::size_t  MaxQueuedRequests     = 64;       // NOLINT(*-magic-numbers)
        static constexpr std::int64_t RequestTimeoutMs      = 30000;    // NOLINT(*-magic-numbers)
        static constexpr const char*  PluginsDirectory      = "/usr/libexec/netcfgd";
        static constexpr const char*  PluginsConnection     = "unix-abstract:netcfgd.plugins";
        static constexpr std::int64_t PluginQueryTimeoutMs  = 2000;     // NOLINT(*-magic-numbers)
        static constexpr std::int64_t PluginApplyTimeoutMs  = 10000;    // NOLINT(*-magic-numbers)
        static constexpr std::int64_t PluginRestartDelayMs  = 1000;     // NOLINT(*-magic-numbers)
        static constexpr std::int64_t ProviderTimeoutMs     = 5000;     // NOLINT(*-magic-numbers)
        static constexpr std::int64_t CheckpointRetentionS  = 60;       // NOLINT(*-magic-numbers)
    };

    /// Loads configuration from the given TOML file.
    ///
    /// A missing file is not an error (all defaults are used then); a malformed one throws.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getIpcConnections() const -> std::vector<std::string>       = 0;
    CETL_NODISCARD virtual auto getIpcMaxRequestSize() const -> std::size_t                 = 0;
    CETL_NODISCARD virtual auto getIpcMaxConcurrentRequests() const -> std::size_t          = 0;
    CETL_NODISCARD virtual auto getIpcMaxQueuedRequests() const -> std::size_t              = 0;
    CETL_NODISCARD virtual auto getRequestsDefaultTimeout() const -> std::chrono::milliseconds = 0;

    CETL_NODISCARD virtual auto getPluginsDirectory() const -> std::string                 = 0;
    CETL_NODISCARD virtual auto getPluginsConnection() const -> std::string                = 0;
    CETL_NODISCARD virtual auto getPluginsQueryTimeout() const -> std::chrono::milliseconds = 0;
    CETL_NODISCARD virtual auto getPluginsApplyTimeout() const -> std::chrono::milliseconds = 0;
    CETL_NODISCARD virtual auto getPluginsRestartDelay() const -> std::chrono::milliseconds = 0;

    CETL_NODISCARD virtual auto getProviderTimeout() const -> std::chrono::milliseconds  = 0;
    CETL_NODISCARD virtual auto getCheckpointsRetention() const -> std::chrono::seconds = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
