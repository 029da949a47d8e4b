//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_TRACKING_MEMORY_RESOURCE_HPP_INCLUDED
#define DEVCTL_TRACKING_MEMORY_RESOURCE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <new>
#include <ostream>
#include <vector>

namespace devctl
{

/// Memory resource which tracks all its (still alive) allocations.
///
/// Used to verify that every PMR allocation made by a test subject is eventually released.
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
            *os << "\n{ptr=0x" << std::hex << alloc.pointer << ", size=" << std::dec << alloc.size << "}";
        }

    };  // Allocation

    // NOLINTBEGIN
    std::vector<Allocation> allocations{};
    std::size_t             total_allocated_bytes{0};
    std::size_t             total_deallocated_bytes{0};
    // NOLINTEND

private:
    // MARK: cetl::pmr::memory_resource

    void* do_allocate(std::size_t size_bytes, std::size_t alignment) override
    {
        if (alignment > alignof(std::max_align_t))
        {
#if defined(__cpp_exceptions)
            throw std::bad_alloc();
#endif
            return nullptr;
        }

        void* ptr = nullptr;
        if (size_bytes > 0)
        {
            ptr = cetl::pmr::new_delete_resource()->allocate(size_bytes, alignment);

            total_allocated_bytes += size_bytes;
            allocations.push_back({size_bytes, ptr});
        }
        return ptr;
    }

    void do_deallocate(void* ptr, std::size_t size_bytes, std::size_t alignment) override
    {
        if (ptr == nullptr)
        {
            return;
        }

        const auto prev_alloc = std::find_if(allocations.cbegin(), allocations.cend(), [ptr](const auto& alloc) {
            //
            return alloc.pointer == ptr;
        });
        if (prev_alloc == allocations.cend())
        {
            ADD_FAILURE() << "Deallocation of unknown memory (ptr=" << ptr << ").";
            return;
        }
        EXPECT_EQ(prev_alloc->size, size_bytes) << "Deallocation size mismatch (ptr=" << ptr << ").";
        allocations.erase(prev_alloc);

        cetl::pmr::new_delete_resource()->deallocate(ptr, size_bytes, alignment);
        total_deallocated_bytes += size_bytes;
    }

    bool do_is_equal(const cetl::pmr::memory_resource& rhs) const noexcept override
    {
        return (&rhs == this);
    }

};  // TrackingMemoryResource

}  // namespace devctl

#endif  // DEVCTL_TRACKING_MEMORY_RESOURCE_HPP_INCLUDED
