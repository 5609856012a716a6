//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_CLI_DESIRED_STATE_READER_HPP_INCLUDED
#define NETCFGD_CLI_DESIRED_STATE_READER_HPP_INCLUDED

#include <netcfgd/model/interface_state.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <string>

namespace netcfgd
{
namespace cli
{

/// Reads desired state documents like:
/// ```toml
/// [[interface]]
/// name = "br0"
/// type = "bridge"
/// state = "up"
/// mtu = 9000
///
/// [[interface]]
/// name = "eth1"
/// controller = "br0"
/// ipv4 = { dhcp = true }
/// ```
/// Keys other than `name` and `type` become properties; nested tables are flattened with dots (`ipv4.dhcp`).
/// Only booleans, integers and strings are accepted as values.
///
class DesiredStateReader final
{
public:
    struct Result final
    {
        using Success = model::DesiredState;
        using Failure = std::string;
        using Var     = cetl::variant<Success, Failure>;
    };

    static Result::Var readFile(const std::string& file_path);
    static Result::Var read(const toml::value& root);

};  // DesiredStateReader

}  // namespace cli
}  // namespace netcfgd

#endif  // NETCFGD_CLI_DESIRED_STATE_READER_HPP_INCLUDED
