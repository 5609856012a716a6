//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // Config

    auto getIpcConnections() const -> std::vector<std::string> override
    {
        auto connections = toml::find_or(root_, "ipc", "connections", std::vector<std::string>{});
        if (connections.empty())
        {
            connections.emplace_back(Defaults::IpcConnection);
        }
        return connections;
    }

    auto getIpcMaxRequestSize() const -> std::size_t override
    {
        return positiveOr("ipc", "max_request_size", Defaults::MaxRequestSize);
    }

    auto getIpcMaxConcurrentRequests() const -> std::size_t override
    {
        return positiveOr("ipc", "max_concurrent_requests", Defaults::MaxConcurrentRequests);
    }

    auto getIpcMaxQueuedRequests() const -> std::size_t override
    {
        // Zero is legit here - no queueing at all.
        const std::int64_t fallback = Defaults::MaxQueuedRequests;
        const auto         value    = toml::find_or(root_, "ipc", "max_queued_requests", fallback);
        return static_cast<std::size_t>((value >= 0) ? value : fallback);
    }

    auto getRequestsDefaultTimeout() const -> std::chrono::milliseconds override
    {
        return std::chrono::milliseconds{positiveOr("requests", "default_timeout_ms", Defaults::RequestTimeoutMs)};
    }

    auto getPluginsDirectory() const -> std::string override
    {
        return toml::find_or(root_, "plugins", "directory", std::string{Defaults::PluginsDirectory});
    }

    auto getPluginsConnection() const -> std::string override
    {
        return toml::find_or(root_, "plugins", "connection", std::string{Defaults::PluginsConnection});
    }

    auto getPluginsQueryTimeout() const -> std::chrono::milliseconds override
    {
        return std::chrono::milliseconds{positiveOr("plugins", "query_timeout_ms", Defaults::PluginQueryTimeoutMs)};
    }

    auto getPluginsApplyTimeout() const -> std::chrono::milliseconds override
    {
        return std::chrono::milliseconds{positiveOr("plugins", "apply_timeout_ms", Defaults::PluginApplyTimeoutMs)};
    }

    auto getPluginsRestartDelay() const -> std::chrono::milliseconds override
    {
        return std::chrono::milliseconds{positiveOr("plugins", "restart_delay_ms", Defaults::PluginRestartDelayMs)};
    }

    auto getProviderTimeout() const -> std::chrono::milliseconds override
    {
        return std::chrono::milliseconds{positiveOr("provider", "timeout_ms", Defaults::ProviderTimeoutMs)};
    }

    auto getCheckpointsRetention() const -> std::chrono::seconds override
    {
        return std::chrono::seconds{positiveOr("checkpoints", "retention_s", Defaults::CheckpointRetentionS)};
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    /// Gets an integer value, but only a positive one - otherwise the fallback.
    ///
    template <typename T>
    T positiveOr(const char* const table, const char* const key, const T fallback) const
    {
        const auto value = toml::find_or(root_, table, key, static_cast<std::int64_t>(fallback));
        return (value > 0) ? static_cast<T>(value) : fallback;
    }

    TomlValue root_;

};  // ConfigImpl

}  // namespace

constexpr const char*  Config::Defaults::IpcConnection;
constexpr std::size_t  Config::Defaults::MaxRequestSize;
constexpr std::size_t  Config::Defaults::MaxConcurrentRequests;
constexpr std::size_t  Config::Defaults::MaxQueuedRequests;
constexpr std::int64_t Config::Defaults::RequestTimeoutMs;
constexpr const char*  Config::Defaults::PluginsDirectory;
constexpr const char*  Config::Defaults::PluginsConnection;
constexpr std::int64_t Config::Defaults::PluginQueryTimeoutMs;
constexpr std::int64_t Config::Defaults::PluginApplyTimeoutMs;
constexpr std::int64_t Config::Defaults::PluginRestartDelayMs;
constexpr std::int64_t Config::Defaults::ProviderTimeoutMs;
constexpr std::int64_t Config::Defaults::CheckpointRetentionS;

Config::Ptr Config::make(std::string file_path)
{
    using TomlValue = ConfigImpl::TomlValue;

    if (!std::ifstream{file_path})
    {
        return std::make_shared<ConfigImpl>(TomlValue{TomlValue::table_type{}});
    }

    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
