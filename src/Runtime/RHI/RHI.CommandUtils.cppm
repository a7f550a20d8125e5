module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI:CommandUtils;

import :Device;
import Core;

export namespace RHI::CommandUtils
{
    // Holds the pool specific to the current thread
    struct ThreadRenderContext
    {
        VkCommandPool CommandPool = VK_NULL_HANDLE;
        uint64_t OwnerId = 0; // VulkanDevice::GetUniqueId()
    };

    ThreadRenderContext& GetThreadContext()
    {
        thread_local ThreadRenderContext ctx;
        return ctx;
    }

    // Records `function(VkCommandBuffer)` into a one-shot buffer, submits it and waits.
    // Only for setup work (texture uploads); never call from inside a frame.
    [[nodiscard]] Core::Result ExecuteImmediate(VulkanDevice& device, auto&& function)
    {
        ThreadRenderContext& ctx = GetThreadContext();

        // Cached pool belongs to another device, possibly a destroyed one allocated at the same
        // address. Its handle died with that device; just forget it.
        if (ctx.CommandPool != VK_NULL_HANDLE && ctx.OwnerId != device.GetUniqueId())
        {
            ctx.CommandPool = VK_NULL_HANDLE;
            ctx.OwnerId = 0;
        }

        if (ctx.CommandPool == VK_NULL_HANDLE)
        {
            VkCommandPoolCreateInfo poolInfo{};
            poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
            poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
            poolInfo.queueFamilyIndex = device.GetQueueIndices().GraphicsFamily.value();

            if (vkCreateCommandPool(device.GetLogicalDevice(), &poolInfo, nullptr, &ctx.CommandPool) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create thread-local command pool!");
                ctx.CommandPool = VK_NULL_HANDLE;
                return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
            }

            // Device destroys registered pools on shutdown.
            ctx.OwnerId = device.GetUniqueId();
            device.RegisterThreadLocalPool(ctx.CommandPool);
        }

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandPool = ctx.CommandPool;
        allocInfo.commandBufferCount = 1;

        VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
        if (vkAllocateCommandBuffers(device.GetLogicalDevice(), &allocInfo, &commandBuffer) != VK_SUCCESS)
        {
            Core::Log::Error("ExecuteImmediate: failed to allocate command buffer.");
            return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
        }

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

        VK_CHECK(vkBeginCommandBuffer(commandBuffer, &beginInfo));
        function(commandBuffer);
        VK_CHECK(vkEndCommandBuffer(commandBuffer));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &commandBuffer;

        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        VkFence fence = VK_NULL_HANDLE;
        VK_CHECK(vkCreateFence(device.GetLogicalDevice(), &fenceInfo, nullptr, &fence));

        Core::Result result = Core::Ok();
        if (device.SubmitToGraphicsQueue(submitInfo, fence) != VK_SUCCESS)
        {
            Core::Log::Error("ExecuteImmediate: queue submission failed.");
            result = Core::Err(Core::ErrorCode::SubmissionFailed);
        }
        else
        {
            VK_CHECK(vkWaitForFences(device.GetLogicalDevice(), 1, &fence, VK_TRUE, UINT64_MAX));
        }

        vkDestroyFence(device.GetLogicalDevice(), fence, nullptr);
        vkFreeCommandBuffers(device.GetLogicalDevice(), ctx.CommandPool, 1, &commandBuffer);
        return result;
    }

    void TransitionImageLayout(VkCommandBuffer cmd, VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout)
    {
        VkImageMemoryBarrier2 barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
        barrier.oldLayout = oldLayout;
        barrier.newLayout = newLayout;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.image = image;
        barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        barrier.subresourceRange.baseMipLevel = 0;
        barrier.subresourceRange.levelCount = VK_REMAINING_MIP_LEVELS;
        barrier.subresourceRange.baseArrayLayer = 0;
        barrier.subresourceRange.layerCount = 1;

        barrier.srcStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        barrier.srcAccessMask = VK_ACCESS_2_MEMORY_WRITE_BIT | VK_ACCESS_2_MEMORY_READ_BIT;
        barrier.dstStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        barrier.dstAccessMask = VK_ACCESS_2_MEMORY_WRITE_BIT | VK_ACCESS_2_MEMORY_READ_BIT;

        if (oldLayout == VK_IMAGE_LAYOUT_UNDEFINED)
        {
            barrier.srcStageMask = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
            barrier.srcAccessMask = 0;
        }

        VkDependencyInfo depInfo{};
        depInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        depInfo.imageMemoryBarrierCount = 1;
        depInfo.pImageMemoryBarriers = &barrier;

        vkCmdPipelineBarrier2(cmd, &depInfo);
    }
}
