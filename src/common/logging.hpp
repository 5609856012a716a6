//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_LOGGING_HPP_INCLUDED
#define NETCFGD_COMMON_LOGGING_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace netcfgd
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Names of the per-subsystem loggers.
///
/// Processes register the subset they use at startup (so that their sinks could be chosen);
/// any other name is cloned from the default logger on first use.
///
namespace logger_names
{
constexpr const char* Io     = "io";
constexpr const char* Ipc    = "ipc";
constexpr const char* Engine = "engine";
constexpr const char* Core   = "core";
constexpr const char* Plugin = "plugin";
constexpr const char* Kernel = "kernel";
constexpr const char* Sdk    = "sdk";
constexpr const char* Svc    = "svc";
}  // namespace logger_names

/// Runs the action, and logs (as critical) instead of propagating an exception of the given type.
///
/// Used where throwing is not an option: destructors, executor callbacks, `noexcept` functions.
///
/// @return `false` if the exception has been caught (always `true` when exceptions are disabled).
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Gets the named logger.
///
/// An unregistered name gets a clone of the default logger (with `SPDLOG_LEVEL` levels applied).
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    performWithoutThrowing([&logger] {
        //
        spdlog::initialize_logger(logger);
    });
    return logger;
}

}  // namespace common
}  // namespace netcfgd

#if (__cplusplus < CETL_CPP_STANDARD_17)
template <>
struct fmt::formatter<cetl::string_view> : formatter<string_view>
{
    auto format(cetl::string_view sv, format_context& ctx) const
    {
        return formatter<string_view>::format(string_view{sv.data(), sv.size()}, ctx);
    }
};
#endif

#endif  // NETCFGD_COMMON_LOGGING_HPP_INCLUDED
