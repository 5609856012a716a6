//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "sysfs_state_provider.hpp"

#include "core/state_provider.hpp"
#include "io/io.hpp"
#include "logging.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/property.hpp"
#include "netcfgd/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <linux/if_vlan.h>
#include <linux/sockios.h>
#include <memory>
#include <net/if.h>
#include <net/if_arp.h>
#include <string>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace kernel
{
namespace
{

constexpr const char* TypeEthernet = "ethernet";
constexpr const char* TypeLoopback = "loopback";
constexpr const char* TypeBridge   = "bridge";
constexpr const char* TypeBond     = "bond";
constexpr const char* TypeVlan     = "vlan";
constexpr const char* TypeDummy    = "dummy";

constexpr std::array<const char*, 6> SupportedTypes{TypeEthernet,
                                                    TypeLoopback,
                                                    TypeBridge,
                                                    TypeBond,
                                                    TypeVlan,
                                                    TypeDummy};

std::string trim(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

cetl::optional<std::string> readFirstLine(const std::string& path)
{
    std::ifstream file{path};
    if (!file)
    {
        return cetl::nullopt;
    }
    std::string line;
    std::getline(file, line);
    return trim(line);
}

cetl::optional<std::int64_t> readInteger(const std::string& path, const int base = 10)
{
    const auto text = readFirstLine(path);
    if (!text || text->empty())
    {
        return cetl::nullopt;
    }
    char*      end   = nullptr;
    const auto value = std::strtoll(text->c_str(), &end, base);
    if (*end != '\0')
    {
        return cetl::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

bool isDirectory(const std::string& path)
{
    struct stat st{};
    return (::stat(path.c_str(), &st) == 0) && S_ISDIR(st.st_mode);
}

bool exists(const std::string& path)
{
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0;
}

/// Gets basename of a symlink target, f.e. `../../br0` -> `br0`.
///
cetl::optional<std::string> readLinkBasename(const std::string& path)
{
    std::array<char, PATH_MAX> buffer{};
    const auto                 length = ::readlink(path.c_str(), buffer.data(), buffer.size() - 1);
    if (length <= 0)
    {
        return cetl::nullopt;
    }
    const std::string target{buffer.data(), static_cast<std::size_t>(length)};
    const auto        slash = target.find_last_of('/');
    return (slash == std::string::npos) ? target : target.substr(slash + 1);
}

model::Error operationFailed(const std::string& name, const std::string& what, const int err)
{
    return model::Error::make(model::ErrorKind::OperationFailed,
                              fmt::format("{} failed for '{}' (err={}, {}).", what, name, err, std::strerror(err)),
                              {name});
}

bool copyName(const std::string& name, char (&dst)[IFNAMSIZ])
{
    if (name.empty() || (name.size() >= IFNAMSIZ))
    {
        return false;
    }
    std::memset(dst, 0, IFNAMSIZ);
    std::memcpy(dst, name.data(), name.size());
    return true;
}

/// Opens a socket for the classic network ioctl-s.
///
cetl::variant<common::io::OwnFd, model::Error> openControlSocket()
{
    int raw_fd = -1;
    if (const auto err = platform::posixSyscallInto(raw_fd, [] {
            //
            return ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        }))
    {
        return model::Error::make(model::ErrorKind::BackendUnavailable,
                                  fmt::format("Can't open control socket (err={}, {}).", err, std::strerror(err)));
    }
    return common::io::OwnFd{raw_fd};
}

/// Performs an ioctl on a fresh control socket.
///
template <typename Arg>
cetl::optional<model::Error> controlIoctl(const std::string& name,
                                          const char*        what,
                                          const unsigned long request,
                                          Arg&               arg)
{
    auto fd_or_error = openControlSocket();
    if (auto* const error = cetl::get_if<model::Error>(&fd_or_error))
    {
        return std::move(*error);
    }
    const auto& fd = cetl::get<common::io::OwnFd>(fd_or_error);

    if (const auto err = platform::posixSyscallError([&fd, request, &arg] {
            //
            return ::ioctl(fd.get(), request, &arg);
        }))
    {
        return operationFailed(name, what, err);
    }
    return cetl::nullopt;
}

cetl::optional<model::Error> invalidName(const std::string& name)
{
    return model::Error::make(model::ErrorKind::OperationFailed,
                              fmt::format("Invalid interface name '{}'.", name),
                              {name});
}

}  // namespace

core::StateProvider::Ptr SysfsStateProvider::make(const Paths& paths)
{
    return std::make_unique<SysfsStateProvider>(paths);
}

SysfsStateProvider::SysfsStateProvider(Paths paths)
    : paths_{std::move(paths)}
{
}

SysfsStateProvider::GetStateResult::Var SysfsStateProvider::getState(const cetl::optional<std::string>& name)
{
    if (!isDirectory(paths_.sys_class_net))
    {
        return model::Error::make(model::ErrorKind::BackendUnavailable,
                                  fmt::format("'{}' is not available.", paths_.sys_class_net));
    }

    const auto vlans = readVlans();

    GetStateResult::Success states;
    if (name)
    {
        if (auto state = readInterface(*name, vlans))
        {
            states.push_back(std::move(*state));
        }
        return states;
    }

    std::vector<std::string> names;
    {
        const std::unique_ptr<DIR, decltype(&::closedir)> dir{::opendir(paths_.sys_class_net.c_str()), &::closedir};
        if (!dir)
        {
            const int err = errno;
            return model::Error::make(model::ErrorKind::BackendUnavailable,
                                      fmt::format("Can't list '{}' (err={}).", paths_.sys_class_net, err));
        }
        while (const auto* const entry = ::readdir(dir.get()))
        {
            const std::string entry_name{entry->d_name};
            if ((entry_name != ".") && (entry_name != "..") && isDirectory(ifacePath(entry_name)))
            {
                names.push_back(entry_name);
            }
        }
    }
    std::sort(names.begin(), names.end());

    for (const auto& iface_name : names)
    {
        // An interface may disappear between listing and reading - it's just skipped then.
        if (auto state = readInterface(iface_name, vlans))
        {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

SysfsStateProvider::ApplyStateResult::Var SysfsStateProvider::applyState(const model::InterfaceState& desired)
{
    auto current_result = getState(desired.name);
    if (auto* const error = cetl::get_if<GetStateResult::Failure>(&current_result))
    {
        return std::move(*error);
    }
    auto&                                 currents = cetl::get<GetStateResult::Success>(current_result);
    cetl::optional<model::InterfaceState> current;
    if (!currents.empty())
    {
        current = std::move(currents.front());
    }

    const auto desired_state = model::findString(desired.properties, model::property::State);
    if (desired_state && (*desired_state == model::property::StateAbsent))
    {
        if (!current)
        {
            logger_->debug("Interface '{}' is already absent.", desired.name);
            return cetl::monostate{};
        }
        if (auto error = remove(*current))
        {
            return std::move(*error);
        }
        return cetl::monostate{};
    }

    if (!current)
    {
        if (auto error = create(desired))
        {
            return std::move(*error);
        }
        auto created_result = getState(desired.name);
        if (auto* const error = cetl::get_if<GetStateResult::Failure>(&created_result))
        {
            return std::move(*error);
        }
        auto& created = cetl::get<GetStateResult::Success>(created_result);
        if (created.empty())
        {
            return model::Error::make(model::ErrorKind::OperationFailed,
                                      fmt::format("Interface '{}' has not appeared after creation.", desired.name),
                                      {desired.name});
        }
        current = std::move(created.front());
    }

    const auto desired_controller = model::findString(desired.properties, model::property::Controller);
    const auto current_controller = model::findString(current->properties, model::property::Controller);
    const bool is_same_controller =
        desired_controller.has_value()
            ? (current_controller.has_value() && (*desired_controller == *current_controller))
            : !current_controller.has_value();
    if (!is_same_controller)
    {
        if (auto error = setController(*current, desired_controller))
        {
            return std::move(*error);
        }
    }

    for (const auto& prop : desired.properties)
    {
        const auto& key = prop.first;
        if (model::property::isReserved(key) || (key == property::OperState) || (key == property::VlanId))
        {
            continue;
        }
        if (model::isSameValue(prop.second, model::findValue(current->properties, key)))
        {
            continue;
        }

        if (key == property::Mtu)
        {
            const auto* const mtu = cetl::get_if<std::int64_t>(&prop.second);
            if (mtu == nullptr)
            {
                return model::Error::make(model::ErrorKind::OperationFailed,
                                          fmt::format("Property '{}' of '{}' must be an integer.", key, desired.name),
                                          {desired.name});
            }
            if (auto error = setMtu(desired.name, *mtu))
            {
                return std::move(*error);
            }
        }
        else if (key == property::MacAddress)
        {
            const auto mac = model::findString(desired.properties, key);
            if (!mac)
            {
                return model::Error::make(model::ErrorKind::OperationFailed,
                                          fmt::format("Property '{}' of '{}' must be a string.", key, desired.name),
                                          {desired.name});
            }
            if (auto error = setMacAddress(desired.name, *mac))
            {
                return std::move(*error);
            }
        }
        else
        {
            logger_->debug("Ignoring unsupported property '{}' of '{}'.", key, desired.name);
        }
    }

    // Admin state goes last so that the interface comes up fully configured.
    if (desired_state)
    {
        if (auto error = setAdminState(desired.name, *desired_state == model::property::StateUp))
        {
            return std::move(*error);
        }
    }
    return cetl::monostate{};
}

bool SysfsStateProvider::supportsType(const std::string& type) const
{
    return std::find(SupportedTypes.begin(), SupportedTypes.end(), type) != SupportedTypes.end();
}

SysfsStateProvider::VlanInfos SysfsStateProvider::readVlans() const
{
    // Format of the table (after two header lines):
    //   eth0.100       | 100  | eth0
    //
    VlanInfos     vlans;
    std::ifstream file{paths_.proc_net_vlan_config};
    std::string   line;
    while (std::getline(file, line))
    {
        const auto first_bar = line.find('|');
        if (first_bar == std::string::npos)
        {
            continue;
        }
        const auto second_bar = line.find('|', first_bar + 1);
        if (second_bar == std::string::npos)
        {
            continue;
        }
        const auto name    = trim(line.substr(0, first_bar));
        const auto id_text = trim(line.substr(first_bar + 1, second_bar - first_bar - 1));
        const auto parent  = trim(line.substr(second_bar + 1));

        char*      end = nullptr;
        const auto id  = std::strtoll(id_text.c_str(), &end, 10);
        if (name.empty() || parent.empty() || id_text.empty() || (*end != '\0'))
        {
            continue;  // header
        }
        vlans[name] = VlanInfo{parent, static_cast<std::int64_t>(id)};
    }
    return vlans;
}

cetl::optional<model::InterfaceState> SysfsStateProvider::readInterface(const std::string& name,
                                                                        const VlanInfos&   vlans) const
{
    const auto path = ifacePath(name);
    if (!isDirectory(path))
    {
        return cetl::nullopt;
    }

    model::InterfaceState state;
    state.name   = name;
    state.type   = typeOf(name, vlans);
    state.source = model::StateSource::KernelOnly;
    if (const auto ifindex = readInteger(path + "/ifindex"))
    {
        state.kernel_index = static_cast<std::int32_t>(*ifindex);
    }

    auto& props = state.properties;
    if (const auto flags = readInteger(path + "/flags", 16))
    {
        props[model::property::State] =
            std::string{((*flags & IFF_UP) != 0) ? model::property::StateUp : model::property::StateDown};
    }
    if (const auto mtu = readInteger(path + "/mtu"))
    {
        props[property::Mtu] = *mtu;
    }
    if (const auto address = readFirstLine(path + "/address"))
    {
        if (!address->empty())
        {
            props[property::MacAddress] = *address;
        }
    }
    if (const auto operstate = readFirstLine(path + "/operstate"))
    {
        props[property::OperState] = *operstate;
    }
    if (const auto master = readLinkBasename(path + "/master"))
    {
        props[model::property::Controller] = *master;
    }

    const auto vlan = vlans.find(name);
    if (vlan != vlans.end())
    {
        props[model::property::Parent] = vlan->second.parent;
        props[property::VlanId]        = vlan->second.id;
    }
    return state;
}

std::string SysfsStateProvider::typeOf(const std::string& name, const VlanInfos& vlans) const
{
    constexpr std::int64_t ArpHrdLoopback = ARPHRD_LOOPBACK;

    const auto path = ifacePath(name);
    if (isDirectory(path + "/bridge"))
    {
        return TypeBridge;
    }
    if (isDirectory(path + "/bonding"))
    {
        return TypeBond;
    }
    if (vlans.find(name) != vlans.end())
    {
        return TypeVlan;
    }
    const auto hw_type = readInteger(path + "/type");
    if (hw_type && (*hw_type == ArpHrdLoopback))
    {
        return TypeLoopback;
    }
    // Physical devices have a backing `device` link; the rest are virtual.
    if (exists(path + "/device"))
    {
        return TypeEthernet;
    }
    return TypeDummy;
}

cetl::optional<model::Error> SysfsStateProvider::create(const model::InterfaceState& desired)
{
    const auto& name = desired.name;
    logger_->debug("Creating {} '{}'.", desired.type, name);

    if (desired.type == TypeBridge)
    {
        std::array<char, IFNAMSIZ> bridge_name{};
        if (name.empty() || (name.size() >= bridge_name.size()))
        {
            return invalidName(name);
        }
        std::copy(name.begin(), name.end(), bridge_name.begin());
        return controlIoctl(name, "SIOCBRADDBR", SIOCBRADDBR, bridge_name);
    }

    if (desired.type == TypeBond)
    {
        return writeSysfs(paths_.sys_class_net + "/bonding_masters", "+" + name);
    }

    if (desired.type == TypeVlan)
    {
        const auto parent = model::findString(desired.properties, model::property::Parent);
        const auto vid    = model::findValue(desired.properties, property::VlanId);
        const auto* const vid_int = cetl::get_if<std::int64_t>(&vid);
        if (!parent || (vid_int == nullptr) || (*vid_int < 1) || (*vid_int > 4094))
        {
            return model::Error::make(model::ErrorKind::OperationFailed,
                                      fmt::format("Vlan '{}' needs '{}' and '{}' (1..4094).",
                                                  name,
                                                  model::property::Parent,
                                                  property::VlanId),
                                      {name});
        }

        vlan_ioctl_args args{};
        args.cmd = ADD_VLAN_CMD;
        if (parent->size() >= sizeof(args.device1))
        {
            return invalidName(*parent);
        }
        std::copy(parent->begin(), parent->end(), args.device1);
        args.u.VID = static_cast<int>(*vid_int);
        if (auto error = controlIoctl(name, "SIOCSIFVLAN", SIOCSIFVLAN, args))
        {
            return error;
        }

        // The kernel names a new vlan as `<parent>.<vid>` - rename it if a different name was requested.
        const auto kernel_name = *parent + "." + std::to_string(*vid_int);
        if (kernel_name != name)
        {
            ifreq req{};
            if (!copyName(kernel_name, req.ifr_name) || !copyName(name, req.ifr_newname))
            {
                return invalidName(name);
            }
            return controlIoctl(name, "SIOCSIFNAME", SIOCSIFNAME, req);
        }
        return cetl::nullopt;
    }

    return model::Error::make(model::ErrorKind::OperationFailed,
                              fmt::format("Interfaces of type '{}' can't be created ('{}').", desired.type, name),
                              {name});
}

cetl::optional<model::Error> SysfsStateProvider::remove(const model::InterfaceState& current)
{
    const auto& name = current.name;
    logger_->debug("Deleting {} '{}'.", current.type, name);

    if (current.type == TypeBridge)
    {
        // A bridge must be down before it could be deleted.
        if (auto error = setAdminState(name, false))
        {
            return error;
        }
        std::array<char, IFNAMSIZ> bridge_name{};
        std::copy(name.begin(), name.end(), bridge_name.begin());
        return controlIoctl(name, "SIOCBRDELBR", SIOCBRDELBR, bridge_name);
    }

    if (current.type == TypeBond)
    {
        return writeSysfs(paths_.sys_class_net + "/bonding_masters", "-" + name);
    }

    if (current.type == TypeVlan)
    {
        vlan_ioctl_args args{};
        args.cmd = DEL_VLAN_CMD;
        std::copy(name.begin(), name.end(), args.device1);
        return controlIoctl(name, "SIOCSIFVLAN", SIOCSIFVLAN, args);
    }

    return model::Error::make(model::ErrorKind::OperationFailed,
                              fmt::format("Interfaces of type '{}' can't be deleted ('{}').", current.type, name),
                              {name});
}

cetl::optional<model::Error> SysfsStateProvider::setController(const model::InterfaceState&       current,
                                                               const cetl::optional<std::string>& controller)
{
    const auto& name  = current.name;
    const auto  vlans = readVlans();

    // Detach from the current controller (if any).
    if (const auto old_controller = model::findString(current.properties, model::property::Controller))
    {
        logger_->debug("Detaching '{}' from '{}'.", name, *old_controller);

        const auto old_type = typeOf(*old_controller, vlans);
        if (old_type == TypeBridge)
        {
            ifreq req{};
            if (!copyName(*old_controller, req.ifr_name))
            {
                return invalidName(*old_controller);
            }
            req.ifr_ifindex = static_cast<int>(::if_nametoindex(name.c_str()));
            if (auto error = controlIoctl(name, "SIOCBRDELIF", SIOCBRDELIF, req))
            {
                return error;
            }
        }
        else if (old_type == TypeBond)
        {
            if (auto error = writeSysfs(ifacePath(*old_controller) + "/bonding/slaves", "-" + name))
            {
                return error;
            }
        }
    }

    if (!controller)
    {
        return cetl::nullopt;
    }

    logger_->debug("Attaching '{}' to '{}'.", name, *controller);

    if (!isDirectory(ifacePath(*controller)))
    {
        return model::Error::make(model::ErrorKind::OperationFailed,
                                  fmt::format("Controller '{}' of '{}' doesn't exist.", *controller, name),
                                  {name, *controller});
    }

    const auto type = typeOf(*controller, vlans);
    if (type == TypeBridge)
    {
        ifreq req{};
        if (!copyName(*controller, req.ifr_name))
        {
            return invalidName(*controller);
        }
        req.ifr_ifindex = static_cast<int>(::if_nametoindex(name.c_str()));
        return controlIoctl(name, "SIOCBRADDIF", SIOCBRADDIF, req);
    }
    if (type == TypeBond)
    {
        // The kernel enslaves only interfaces which are down.
        if (auto error = setAdminState(name, false))
        {
            return error;
        }
        return writeSysfs(ifacePath(*controller) + "/bonding/slaves", "+" + name);
    }

    return model::Error::make(model::ErrorKind::OperationFailed,
                              fmt::format("'{}' ({}) can't be a controller of '{}'.", *controller, type, name),
                              {name, *controller});
}

cetl::optional<model::Error> SysfsStateProvider::setMtu(const std::string& name, const std::int64_t mtu)
{
    logger_->debug("Setting mtu of '{}' to {}.", name, mtu);

    ifreq req{};
    if (!copyName(name, req.ifr_name))
    {
        return invalidName(name);
    }
    req.ifr_mtu = static_cast<int>(mtu);
    return controlIoctl(name, "SIOCSIFMTU", SIOCSIFMTU, req);
}

cetl::optional<model::Error> SysfsStateProvider::setMacAddress(const std::string& name, const std::string& mac)
{
    logger_->debug("Setting mac address of '{}' to {}.", name, mac);

    std::array<unsigned int, 6> octets{};
    char                        trailing = 0;
    const int                   parsed   = std::sscanf(mac.c_str(),
                                        "%x:%x:%x:%x:%x:%x%c",
                                        &octets[0],
                                        &octets[1],
                                        &octets[2],
                                        &octets[3],
                                        &octets[4],
                                        &octets[5],
                                        &trailing);
    if ((parsed != 6) || std::any_of(octets.begin(), octets.end(), [](const auto octet) { return octet > 0xFFU; }))
    {
        return model::Error::make(model::ErrorKind::OperationFailed,
                                  fmt::format("Invalid mac address '{}' of '{}'.", mac, name),
                                  {name});
    }

    ifreq req{};
    if (!copyName(name, req.ifr_name))
    {
        return invalidName(name);
    }
    req.ifr_hwaddr.sa_family = ARPHRD_ETHER;
    for (std::size_t i = 0; i < octets.size(); ++i)
    {
        req.ifr_hwaddr.sa_data[i] = static_cast<char>(octets[i]);
    }
    return controlIoctl(name, "SIOCSIFHWADDR", SIOCSIFHWADDR, req);
}

cetl::optional<model::Error> SysfsStateProvider::setAdminState(const std::string& name, const bool is_up)
{
    ifreq req{};
    if (!copyName(name, req.ifr_name))
    {
        return invalidName(name);
    }
    if (auto error = controlIoctl(name, "SIOCGIFFLAGS", SIOCGIFFLAGS, req))
    {
        return error;
    }

    const bool was_up = (req.ifr_flags & IFF_UP) != 0;
    if (was_up == is_up)
    {
        return cetl::nullopt;
    }

    logger_->debug("Setting '{}' {}.", name, is_up ? model::property::StateUp : model::property::StateDown);
    if (is_up)
    {
        req.ifr_flags = static_cast<short>(req.ifr_flags | IFF_UP);
    }
    else
    {
        req.ifr_flags = static_cast<short>(req.ifr_flags & ~IFF_UP);
    }
    return controlIoctl(name, "SIOCSIFFLAGS", SIOCSIFFLAGS, req);
}

cetl::optional<model::Error> SysfsStateProvider::writeSysfs(const std::string& path, const std::string& value)
{
    logger_->trace("Writing '{}' to '{}'.", value, path);

    std::ofstream file{path};
    if (file)
    {
        file << value;
        file.flush();
    }
    if (!file)
    {
        const int err = errno;
        return model::Error::make(model::ErrorKind::OperationFailed,
                                  fmt::format("Can't write '{}' to '{}' (err={}).", value, path, err));
    }
    return cetl::nullopt;
}

}  // namespace kernel
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
