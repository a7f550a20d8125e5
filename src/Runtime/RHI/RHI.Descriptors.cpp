module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

module RHI:Descriptors.Impl;

import :Descriptors;
import :Device;
import Core;

namespace RHI
{
    // --- Descriptor Layout ---
    DescriptorLayout::DescriptorLayout(VulkanDevice& device, std::span<const VkDescriptorSetLayoutBinding> bindings)
        : m_Device(device)
    {
        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.bindingCount = static_cast<uint32_t>(bindings.size());
        layoutInfo.pBindings = bindings.data();

        if (vkCreateDescriptorSetLayout(m_Device.GetLogicalDevice(), &layoutInfo, nullptr, &m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout ({} bindings)!", bindings.size());
            m_Layout = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    DescriptorLayout::~DescriptorLayout()
    {
        if (m_Layout) vkDestroyDescriptorSetLayout(m_Device.GetLogicalDevice(), m_Layout, nullptr);
    }

    // --- Descriptor Allocator ---
    DescriptorAllocator::DescriptorAllocator(VulkanDevice& device, uint32_t setsPerPool)
        : m_Device(device), m_SetsPerPool(setsPerPool)
    {
        m_CurrentPool = GrabPool();
        if (m_CurrentPool == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }
        m_UsedPools.push_back(m_CurrentPool);
    }

    DescriptorAllocator::~DescriptorAllocator()
    {
        VkDevice device = m_Device.GetLogicalDevice();
        for (VkDescriptorPool pool : m_UsedPools) vkDestroyDescriptorPool(device, pool, nullptr);
        for (VkDescriptorPool pool : m_FreePools) vkDestroyDescriptorPool(device, pool, nullptr);
    }

    VkDescriptorPool DescriptorAllocator::GrabPool()
    {
        if (!m_FreePools.empty())
        {
            VkDescriptorPool pool = m_FreePools.back();
            m_FreePools.pop_back();
            return pool;
        }

        // Sprite sets: one combined image sampler each, plus the occasional extra buffer.
        const std::array<VkDescriptorPoolSize, 3> poolSizes = {{
            {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, m_SetsPerPool},
            {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, m_SetsPerPool},
            {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, m_SetsPerPool},
        }};

        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
        poolInfo.pPoolSizes = poolSizes.data();
        poolInfo.maxSets = m_SetsPerPool;

        VkDescriptorPool pool = VK_NULL_HANDLE;
        if (vkCreateDescriptorPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &pool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool!");
            return VK_NULL_HANDLE;
        }
        return pool;
    }

    VkDescriptorSet DescriptorAllocator::Allocate(VkDescriptorSetLayout layout)
    {
        if (m_CurrentPool == VK_NULL_HANDLE) return VK_NULL_HANDLE;

        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.descriptorPool = m_CurrentPool;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &layout;

        VkDescriptorSet set = VK_NULL_HANDLE;
        VkResult result = vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set);
        if (result == VK_SUCCESS) return set;

        if (result != VK_ERROR_OUT_OF_POOL_MEMORY && result != VK_ERROR_FRAGMENTED_POOL)
        {
            Core::Log::Error("Failed to allocate descriptor set! VkResult={}", static_cast<int>(result));
            return VK_NULL_HANDLE;
        }

        // Pool exhausted: move on to a fresh one and retry once.
        m_CurrentPool = GrabPool();
        if (m_CurrentPool == VK_NULL_HANDLE) return VK_NULL_HANDLE;
        m_UsedPools.push_back(m_CurrentPool);

        allocInfo.descriptorPool = m_CurrentPool;
        if (vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate descriptor set from a fresh pool!");
            return VK_NULL_HANDLE;
        }
        return set;
    }

    void DescriptorAllocator::Reset()
    {
        VkDevice device = m_Device.GetLogicalDevice();
        for (VkDescriptorPool pool : m_UsedPools)
        {
            VK_CHECK(vkResetDescriptorPool(device, pool, 0));
            m_FreePools.push_back(pool);
        }
        m_UsedPools.clear();

        m_CurrentPool = GrabPool();
        if (m_CurrentPool != VK_NULL_HANDLE) m_UsedPools.push_back(m_CurrentPool);
    }
}
