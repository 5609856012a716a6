//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_KERNEL_SYSFS_STATE_PROVIDER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_KERNEL_SYSFS_STATE_PROVIDER_HPP_INCLUDED

#include "core/state_provider.hpp"
#include "logging.hpp"

#include "netcfgd/model/interface_state.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace kernel
{

/// Kernel-native property names reported (and applied) by the sysfs provider.
namespace property
{

constexpr const char* Mtu        = "mtu";
constexpr const char* MacAddress = "mac-address";
constexpr const char* OperState  = "oper-state";
constexpr const char* VlanId     = "vlan.id";

}  // namespace property

/// Linux state provider - reads sysfs/procfs, and writes with the classic ioctl and sysfs interfaces.
///
/// Supported interface types: `ethernet`, `loopback`, `bridge`, `bond`, `vlan` and `dummy`.
/// Only bridges, bonds and vlans can be created or deleted.
///
class SysfsStateProvider final : public core::StateProvider
{
public:
    struct Paths final
    {
        std::string sys_class_net{"/sys/class/net"};
        std::string proc_net_vlan_config{"/proc/net/vlan/config"};
    };

    CETL_NODISCARD static core::StateProvider::Ptr make(const Paths& paths = Paths{});

    explicit SysfsStateProvider(Paths paths);

    SysfsStateProvider(const SysfsStateProvider&)                = delete;
    SysfsStateProvider(SysfsStateProvider&&) noexcept            = delete;
    SysfsStateProvider& operator=(const SysfsStateProvider&)     = delete;
    SysfsStateProvider& operator=(SysfsStateProvider&&) noexcept = delete;

    ~SysfsStateProvider() override = default;

    // core::StateProvider

    CETL_NODISCARD GetStateResult::Var   getState(const cetl::optional<std::string>& name) override;
    CETL_NODISCARD ApplyStateResult::Var applyState(const model::InterfaceState& desired) override;
    CETL_NODISCARD bool                  supportsType(const std::string& type) const override;

private:
    struct VlanInfo final
    {
        std::string  parent;
        std::int64_t id;
    };
    using VlanInfos = std::map<std::string, VlanInfo>;

    /// Parses the procfs vlan table; an absent `8021q` module just means "no vlans".
    VlanInfos readVlans() const;

    cetl::optional<model::InterfaceState> readInterface(const std::string& name, const VlanInfos& vlans) const;

    std::string typeOf(const std::string& name, const VlanInfos& vlans) const;

    std::string ifacePath(const std::string& name) const
    {
        return paths_.sys_class_net + "/" + name;
    }

    CETL_NODISCARD cetl::optional<model::Error> create(const model::InterfaceState& desired);
    CETL_NODISCARD cetl::optional<model::Error> remove(const model::InterfaceState& current);
    CETL_NODISCARD cetl::optional<model::Error> setController(const model::InterfaceState& current,
                                                              const cetl::optional<std::string>& controller);
    CETL_NODISCARD cetl::optional<model::Error> setMtu(const std::string& name, const std::int64_t mtu);
    CETL_NODISCARD cetl::optional<model::Error> setMacAddress(const std::string& name, const std::string& mac);
    CETL_NODISCARD cetl::optional<model::Error> setAdminState(const std::string& name, const bool is_up);
    CETL_NODISCARD cetl::optional<model::Error> writeSysfs(const std::string& path, const std::string& value);

    const Paths       paths_;
    common::LoggerPtr logger_{common::getLogger(common::logger_names::Kernel)};

};  // SysfsStateProvider

}  // namespace kernel
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_KERNEL_SYSFS_STATE_PROVIDER_HPP_INCLUDED
