//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_DSDL_HELPERS_HPP_INCLUDED
#define NETCFGD_COMMON_DSDL_HELPERS_HPP_INCLUDED

#include <cetl/pf20/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace netcfgd
{
namespace common
{

/// Messages which could be serialized into this many bytes use a stack buffer; bigger ones
/// (f.e. interface lists of apply requests) are serialized into a heap buffer.
///
constexpr std::size_t SmallPayloadSize = 256;

namespace detail
{

template <std::size_t Size, bool IsSmall = (Size <= SmallPayloadSize)>
class SerializationBuffer;

template <std::size_t Size>
class SerializationBuffer<Size, true>
{
public:
    std::uint8_t* data() noexcept
    {
        return bytes_.data();
    }

private:
    // No need to zero the buffer - only serialized bytes are used.
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    std::array<std::uint8_t, Size> bytes_;

};  // SerializationBuffer

template <std::size_t Size>
class SerializationBuffer<Size, false>
{
public:
    std::uint8_t* data() noexcept
    {
        return bytes_->data();
    }

private:
    std::unique_ptr<std::array<std::uint8_t, Size>> bytes_{new std::array<std::uint8_t, Size>};

};  // SerializationBuffer

}  // namespace detail

template <typename Message>
static auto tryDeserializePayload(const cetl::span<const std::uint8_t> payload, Message& out_message)
{
    return deserialize(out_message, {payload.data(), payload.size()});
}

/// Serializes the message, and passes its bytes (valid during the call only) to the action.
///
/// @return `EINVAL` if the message can't be serialized, otherwise result of the action.
///
template <typename Message, typename Action>
static int tryPerformOnSerialized(const Message& message, Action&& action)
{
    constexpr std::size_t BufferSize = Message::_traits_::SerializationBufferSizeBytes;

    detail::SerializationBuffer<BufferSize> buffer;
    const auto                              result_size = serialize(message, {buffer.data(), BufferSize});
    if (!result_size)
    {
        return EINVAL;
    }

    const cetl::span<const std::uint8_t> bytes{buffer.data(), result_size.value()};
    return std::forward<Action>(action)(bytes);
}

}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_DSDL_HELPERS_HPP_INCLUDED
