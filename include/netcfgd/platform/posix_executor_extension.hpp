//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
#define NETCFGD_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <cstdint>
#include <utility>

namespace netcfgd
{
namespace platform
{

/// Extends a single-threaded executor with callbacks which are triggered by readiness of POSIX file descriptors.
///
/// Available via `cetl::rtti_cast<IPosixExecutorExtension*>(&executor)`.
///
class IPosixExecutorExtension
{
    // 5B1F0E2C-3A6D-4E8B-9C47-D2A81F63B590
    using TypeIdType = cetl::
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        type_id_type<0x5B, 0x1F, 0x0E, 0x2C, 0x3A, 0x6D, 0x4E, 0x8B, 0x9C, 0x47, 0xD2, 0xA8, 0x1F, 0x63, 0xB5, 0x90>;

public:
    IPosixExecutorExtension(const IPosixExecutorExtension&)                = delete;
    IPosixExecutorExtension(IPosixExecutorExtension&&) noexcept            = delete;
    IPosixExecutorExtension& operator=(const IPosixExecutorExtension&)     = delete;
    IPosixExecutorExtension& operator=(IPosixExecutorExtension&&) noexcept = delete;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable>;
    };

    /// RAII handle of a registered awaitable callback.
    ///
    /// Destruction (or `reset`) unregisters the file descriptor from the executor.
    ///
    class Awaitable final
    {
    public:
        using Id = std::uint64_t;

        Awaitable() = default;
        Awaitable(IPosixExecutorExtension& extension, const Id id)
            : extension_{&extension}
            , id_{id}
        {
        }

        Awaitable(Awaitable&& other) noexcept
            : extension_{std::exchange(other.extension_, nullptr)}
            , id_{other.id_}
        {
        }

        Awaitable& operator=(Awaitable&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                extension_ = std::exchange(other.extension_, nullptr);
                id_        = other.id_;
            }
            return *this;
        }

        ~Awaitable()
        {
            reset();
        }

        Awaitable(const Awaitable&)            = delete;
        Awaitable& operator=(const Awaitable&) = delete;

        bool has_value() const noexcept
        {
            return extension_ != nullptr;
        }

        explicit operator bool() const noexcept
        {
            return has_value();
        }

        void reset() noexcept
        {
            if (auto* const extension = std::exchange(extension_, nullptr))
            {
                extension->releaseAwaitable(id_);
            }
        }

    private:
        IPosixExecutorExtension* extension_{nullptr};
        Id                       id_{0};

    };  // Awaitable

    CETL_NODISCARD virtual Awaitable registerAwaitableCallback(libcyphal::IExecutor::Callback::Function&& function,
                                                               const Trigger::Variant& trigger) = 0;

    // MARK: RTTI

    static constexpr cetl::type_id _get_type_id_() noexcept
    {
        return cetl::type_id_type_value<TypeIdType>();
    }

protected:
    IPosixExecutorExtension()  = default;
    ~IPosixExecutorExtension() = default;

    virtual void releaseAwaitable(const Awaitable::Id id) noexcept = 0;

};  // IPosixExecutorExtension

}  // namespace platform
}  // namespace netcfgd

#endif  // NETCFGD_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
