//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_TRACKING_MEMORY_RESOURCE_HPP_INCLUDED
#define NETCFGD_TRACKING_MEMORY_RESOURCE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <vector>

namespace netcfgd
{

/// Memory resource which keeps track of all its live allocations.
///
/// Tests check at tear down that nothing has leaked (`allocations` is empty,
/// and allocated bytes are balanced by deallocated ones).
///
class TrackingMemoryResource final : public cetl::pmr::memory_resource
{
public:
    struct Allocation final
    {
        std::size_t size;
        void*       pointer;

        friend void PrintTo(const Allocation& alloc, std::ostream* os)
        {
            *os << "\n{ptr=" << alloc.pointer << ", size=" << alloc.size << "}";
        }
    };

    // NOLINTBEGIN
    std::vector<Allocation>     allocations{};
    std::size_t                 total_allocated_bytes   = 0;
    std::size_t                 total_deallocated_bytes = 0;
    cetl::pmr::memory_resource* memory_                 = cetl::pmr::new_delete_resource();
    // NOLINTEND

private:
    // MARK: cetl::pmr::memory_resource

    void* do_allocate(std::size_t size_bytes, std::size_t alignment) override
    {
        void* const pointer = memory_->allocate(size_bytes, alignment);
        if (pointer != nullptr)
        {
            total_allocated_bytes += size_bytes;
            allocations.push_back({size_bytes, pointer});
        }
        return pointer;
    }

    void do_deallocate(void* pointer, std::size_t size_bytes, std::size_t alignment) override
    {
        const auto prev_alloc = std::find_if(allocations.cbegin(), allocations.cend(), [pointer](const auto& alloc) {
            //
            return alloc.pointer == pointer;
        });
        if (prev_alloc != allocations.cend())
        {
            allocations.erase(prev_alloc);
        }
        total_deallocated_bytes += size_bytes;

        memory_->deallocate(pointer, size_bytes, alignment);
    }

    bool do_is_equal(const cetl::pmr::memory_resource& rhs) const noexcept override
    {
        return (&rhs == this);
    }

};  // TrackingMemoryResource

}  // namespace netcfgd

#endif  // NETCFGD_TRACKING_MEMORY_RESOURCE_HPP_INCLUDED
