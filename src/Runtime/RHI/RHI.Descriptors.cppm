module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <span>
#include <vector>

export module RHI:Descriptors;

import :Device;

export namespace RHI
{
    class DescriptorLayout
    {
    public:
        // Empty `bindings` yields a valid, empty set layout (placeholder for unused set indices).
        DescriptorLayout(VulkanDevice& device, std::span<const VkDescriptorSetLayoutBinding> bindings);
        ~DescriptorLayout();

        DescriptorLayout(const DescriptorLayout&) = delete;
        DescriptorLayout& operator=(const DescriptorLayout&) = delete;

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        bool m_IsValid = true;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
    };

    // Growing pool allocator. Sets live until the next Reset(); one allocator per frame in flight.
    class DescriptorAllocator
    {
    public:
        explicit DescriptorAllocator(VulkanDevice& device, uint32_t setsPerPool = 256);
        ~DescriptorAllocator();

        DescriptorAllocator(const DescriptorAllocator&) = delete;
        DescriptorAllocator& operator=(const DescriptorAllocator&) = delete;

        // Returns VK_NULL_HANDLE only if a fresh pool cannot be created either.
        [[nodiscard]] VkDescriptorSet Allocate(VkDescriptorSetLayout layout);

        // Recycles every pool. All sets handed out so far become invalid.
        void Reset();

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        uint32_t m_SetsPerPool;
        bool m_IsValid = true;

        std::vector<VkDescriptorPool> m_UsedPools;
        std::vector<VkDescriptorPool> m_FreePools;
        VkDescriptorPool m_CurrentPool = VK_NULL_HANDLE;

        [[nodiscard]] VkDescriptorPool GrabPool();
    };
}
