module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:TransientAllocator;

import :Device;
import :Buffer;
import Core;

export namespace RHI
{
    // Host-visible bump allocator for per-frame vertex/instance data.
    // Everything handed out is valid until the next Reset(); keep one allocator per frame in flight.
    class TransientAllocator
    {
    public:
        struct Allocation
        {
            VkBuffer Buffer = VK_NULL_HANDLE;
            VkDeviceSize Offset = 0;
            VkDeviceSize Size = 0;
            void* MappedPtr = nullptr; // points at Offset, not at the page start

            [[nodiscard]] bool IsValid() const { return Buffer != VK_NULL_HANDLE; }
        };

        explicit TransientAllocator(VulkanDevice& device,
                                    VkDeviceSize pageSizeBytes = 4ull * 1024ull * 1024ull,
                                    VkBufferUsageFlags usage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT |
                                                               VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT |
                                                               VK_BUFFER_USAGE_STORAGE_BUFFER_BIT);
        ~TransientAllocator() = default;

        TransientAllocator(const TransientAllocator&) = delete;
        TransientAllocator& operator=(const TransientAllocator&) = delete;

        // Called at frame begin, after the fence guarding this allocator's last frame signalled.
        void Reset();

        // O(1) bump allocation (amortized O(1) including occasionally growing pages).
        [[nodiscard]] Allocation Allocate(VkDeviceSize sizeBytes, VkDeviceSize alignment = 16);

        // Allocate + memcpy + flush.
        [[nodiscard]] Core::Expected<Allocation> Upload(std::span<const std::byte> bytes, VkDeviceSize alignment = 16);

        [[nodiscard]] size_t GetPageCount() const { return m_Pages.size(); }

    private:
        struct Page
        {
            std::unique_ptr<VulkanBuffer> Buffer;
            VkDeviceSize UsedOffset = 0;
        };

        [[nodiscard]] bool CreatePage(VkDeviceSize sizeBytes);

        VulkanDevice& m_Device;
        VkDeviceSize m_PageSize = 0;
        VkBufferUsageFlags m_Usage = 0;

        std::vector<Page> m_Pages;
        size_t m_ActivePageIndex = 0;

        std::mutex m_Mutex;
    };
}
