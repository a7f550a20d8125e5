module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include "RHI.Vulkan.hpp"

module RHI:TransientAllocator.Impl;

import :TransientAllocator;
import :Buffer;
import Core;

namespace RHI
{
    static constexpr VkDeviceSize AlignUpPow2(VkDeviceSize offset, VkDeviceSize alignment)
    {
        return (offset + alignment - 1) & ~(alignment - 1);
    }

    TransientAllocator::TransientAllocator(VulkanDevice& device, VkDeviceSize pageSizeBytes, VkBufferUsageFlags usage)
        : m_Device(device)
          , m_PageSize(pageSizeBytes)
          , m_Usage(usage)
    {
    }

    void TransientAllocator::Reset()
    {
        std::lock_guard lock(m_Mutex);

        for (auto& page : m_Pages)
        {
            page.UsedOffset = 0;
        }
        m_ActivePageIndex = 0;
    }

    TransientAllocator::Allocation TransientAllocator::Allocate(VkDeviceSize sizeBytes, VkDeviceSize alignment)
    {
        if (sizeBytes == 0)
        {
            return {};
        }

        alignment = std::max<VkDeviceSize>(alignment, 1);
        if ((alignment & (alignment - 1)) != 0)
        {
            Core::Log::Error("TransientAllocator: Non power-of-two alignment {}", static_cast<uint64_t>(alignment));
            return {};
        }

        std::lock_guard lock(m_Mutex);

        // Try to allocate from existing pages.
        for (size_t i = m_ActivePageIndex; i < m_Pages.size(); ++i)
        {
            auto& page = m_Pages[i];
            const VkDeviceSize alignedOffset = AlignUpPow2(page.UsedOffset, alignment);

            if (alignedOffset + sizeBytes <= page.Buffer->GetSizeBytes())
            {
                m_ActivePageIndex = i;
                page.UsedOffset = alignedOffset + sizeBytes;
                return {page.Buffer->GetHandle(), alignedOffset, sizeBytes,
                        static_cast<std::byte*>(page.Buffer->GetMappedData()) + alignedOffset};
            }
        }

        // Need a new page. Grow to fit this request.
        if (!CreatePage(std::max(m_PageSize, sizeBytes)))
        {
            return {};
        }

        // Place at offset 0 (0 is aligned for any power-of-two alignment).
        auto& page = m_Pages.back();
        page.UsedOffset = sizeBytes;
        m_ActivePageIndex = m_Pages.size() - 1;
        return {page.Buffer->GetHandle(), 0, sizeBytes, page.Buffer->GetMappedData()};
    }

    Core::Expected<TransientAllocator::Allocation> TransientAllocator::Upload(std::span<const std::byte> bytes,
                                                                              VkDeviceSize alignment)
    {
        if (bytes.empty())
        {
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        Allocation allocation = Allocate(bytes.size(), alignment);
        if (!allocation.IsValid())
        {
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
        }

        std::memcpy(allocation.MappedPtr, bytes.data(), bytes.size());

        std::lock_guard lock(m_Mutex);
        for (auto& page : m_Pages)
        {
            if (page.Buffer->GetHandle() == allocation.Buffer)
            {
                page.Buffer->Flush(static_cast<size_t>(allocation.Offset), static_cast<size_t>(allocation.Size));
                break;
            }
        }
        return allocation;
    }

    bool TransientAllocator::CreatePage(VkDeviceSize sizeBytes)
    {
        auto buffer = std::make_unique<VulkanBuffer>(m_Device, static_cast<size_t>(sizeBytes), m_Usage,
                                                     VMA_MEMORY_USAGE_CPU_TO_GPU);
        if (!buffer->IsValid() || !buffer->IsHostVisible())
        {
            Core::Log::Error("TransientAllocator: failed to create host-visible page (size={} bytes, pages={})",
                             static_cast<uint64_t>(sizeBytes), m_Pages.size());
            return false;
        }

        m_Pages.push_back(Page{std::move(buffer), 0});
        return true;
    }
}
