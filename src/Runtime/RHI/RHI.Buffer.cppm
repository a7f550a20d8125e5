module;
#include <cstddef>
#include <cstdint>
#include <cstring>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;
import Core;

export namespace RHI
{
    class VulkanBuffer
    {
    public:
        // usage: VertexBuffer, TransferSrc, ...
        // memoryUsage: AUTO_PREFER_HOST / CPU_TO_GPU / CPU_ONLY / GPU_TO_CPU buffers are persistently mapped at creation.
        VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, VmaMemoryUsage memoryUsage);
        ~VulkanBuffer();

        // Disable copy
        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        // Enable move for efficient container storage
        VulkanBuffer(VulkanBuffer&& other) noexcept;
        VulkanBuffer& operator=(VulkanBuffer&& other) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE; }

        // Persistent pointer for host-visible buffers, nullptr for GPU-only memory.
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }
        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }

        [[nodiscard]] Core::Result Write(const void* data, size_t size, size_t offset = 0)
        {
            if (size == 0) return Core::Ok();
            if (!data) return Core::Err(Core::ErrorCode::InvalidArgument);
            if (offset + size > m_SizeBytes)
            {
                Core::Log::Error("VulkanBuffer::Write(): out of bounds. size={} offset={} cap={}", size, offset, m_SizeBytes);
                return Core::Err(Core::ErrorCode::OutOfRange);
            }
            if (!m_MappedData)
            {
                Core::Log::Error("VulkanBuffer::Write(): buffer is not host-visible. size={} offset={}", size, offset);
                return Core::Err(Core::ErrorCode::InvalidState);
            }

            std::memcpy(static_cast<std::byte*>(m_MappedData) + offset, data, size);
            Flush(offset, size);
            return Core::Ok();
        }

        void Flush(size_t offset, size_t size);
        // Makes device writes visible to the host (readback buffers).
        void Invalidate(size_t offset, size_t size);

    private:
        VulkanDevice* m_Device = nullptr;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        void* m_MappedData = nullptr;
        size_t m_SizeBytes = 0;
    };
}
