module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <vector>

module Graphics:OffscreenRenderContext.Impl;

import RHI;
import Core;
import :OffscreenRenderContext;
import :DrawInfo;
import :RenderContext;

namespace Graphics
{
    OffscreenRenderContext::OffscreenRenderContext(RHI::VulkanDevice& device, const OffscreenTargetConfig& config)
        : m_Device(device), m_Config(config)
    {
        if (RHI::GetColorTexelSize(m_Config.ColorFormat) == 0)
        {
            Core::Log::Error("OffscreenRenderContext: unsupported color format {}",
                             static_cast<int>(m_Config.ColorFormat));
            m_IsValid = false;
            return;
        }

        m_Target = std::make_unique<RHI::VulkanImage>(
            m_Device, m_Config.Width, m_Config.Height, m_Config.ColorFormat,
            VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT);
        if (!m_Target->IsValid())
        {
            m_IsValid = false;
            return;
        }

        m_Frames.resize(m_Device.GetFramesInFlight());
        for (FrameSlot& frame : m_Frames)
        {
            VkCommandBufferAllocateInfo allocInfo{};
            allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            allocInfo.commandPool = m_Device.GetCommandPool();
            allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            allocInfo.commandBufferCount = 1;
            if (vkAllocateCommandBuffers(m_Device.GetLogicalDevice(), &allocInfo, &frame.Cmd) != VK_SUCCESS)
            {
                Core::Log::Error("OffscreenRenderContext: failed to allocate command buffers!");
                m_IsValid = false;
                return;
            }

            // Signalled so the first BeginFrame on each slot does not block.
            VkFenceCreateInfo fenceInfo{};
            fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;
            if (vkCreateFence(m_Device.GetLogicalDevice(), &fenceInfo, nullptr, &frame.InFlight) != VK_SUCCESS)
            {
                Core::Log::Error("OffscreenRenderContext: failed to create frame fence!");
                m_IsValid = false;
                return;
            }

            frame.Uploads = std::make_unique<RHI::TransientAllocator>(m_Device, m_Config.UploadPageSize);
            frame.Descriptors = std::make_unique<RHI::DescriptorAllocator>(m_Device);
            if (!frame.Descriptors->IsValid())
            {
                m_IsValid = false;
                return;
            }
        }

        Core::Log::Info("OffscreenRenderContext: {}x{} target, {} frames in flight",
                        m_Config.Width, m_Config.Height, m_Frames.size());
    }

    OffscreenRenderContext::~OffscreenRenderContext()
    {
        m_Device.WaitIdle();
        m_Stream.reset();

        VkDevice device = m_Device.GetLogicalDevice();
        for (FrameSlot& frame : m_Frames)
        {
            if (frame.InFlight) vkDestroyFence(device, frame.InFlight, nullptr);
            if (frame.Cmd) vkFreeCommandBuffers(device, m_Device.GetCommandPool(), 1, &frame.Cmd);
        }
    }

    Core::Result OffscreenRenderContext::BeginFrame(const Color& clearColor)
    {
        if (!m_IsValid)
        {
            return Core::Err(Core::ErrorCode::InvalidState);
        }
        if (m_Recording)
        {
            Core::Log::Error("OffscreenRenderContext: BeginFrame while already recording");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        FrameSlot& frame = m_Frames[m_FrameIndex];
        VkDevice device = m_Device.GetLogicalDevice();

        // 1. Wait until the GPU is done with this slot, then recycle everything it used.
        if (vkWaitForFences(device, 1, &frame.InFlight, VK_TRUE, UINT64_MAX) != VK_SUCCESS)
        {
            Core::Log::Error("OffscreenRenderContext: waiting for frame slot {} failed", m_FrameIndex);
            return Core::Err(Core::ErrorCode::DeviceLost);
        }
        m_Device.FlushDeletionQueue(m_FrameIndex);
        frame.Uploads->Reset();
        frame.Descriptors->Reset();

        // 2. Begin recording.
        VK_CHECK(vkResetCommandBuffer(frame.Cmd, 0));
        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        if (vkBeginCommandBuffer(frame.Cmd, &beginInfo) != VK_SUCCESS)
        {
            Core::Log::Error("OffscreenRenderContext: failed to begin command buffer");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        // Both slots share one target: transitioning from the last known layout (not UNDEFINED)
        // orders this frame's writes after the previous frame's.
        RHI::CommandUtils::TransitionImageLayout(frame.Cmd, m_Target->GetHandle(),
                                                 m_TargetLayout, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);

        // 3. Dynamic rendering with clear.
        VkRenderingAttachmentInfo colorAttachment{};
        colorAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
        colorAttachment.imageView = m_Target->GetView();
        colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        colorAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
        colorAttachment.clearValue.color = {{clearColor.R, clearColor.G, clearColor.B, clearColor.A}};

        const VkExtent2D extent{m_Config.Width, m_Config.Height};

        VkRenderingInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
        renderingInfo.renderArea = {{0, 0}, extent};
        renderingInfo.layerCount = 1;
        renderingInfo.colorAttachmentCount = 1;
        renderingInfo.pColorAttachments = &colorAttachment;
        vkCmdBeginRendering(frame.Cmd, &renderingInfo);

        VkViewport viewport{};
        viewport.x = 0.0f;
        viewport.y = 0.0f;
        viewport.width = static_cast<float>(extent.width);
        viewport.height = static_cast<float>(extent.height);
        viewport.minDepth = 0.0f;
        viewport.maxDepth = 1.0f;
        vkCmdSetViewport(frame.Cmd, 0, 1, &viewport);

        VkRect2D scissor{{0, 0}, extent};
        vkCmdSetScissor(frame.Cmd, 0, 1, &scissor);

        m_Stream = std::make_unique<RHI::VulkanCommandStream>(m_Device, frame.Cmd, *frame.Uploads, *frame.Descriptors);
        m_Recording = true;
        return Core::Ok();
    }

    RHI::ICommandStream& OffscreenRenderContext::GetCommandStream()
    {
        return *m_Stream;
    }

    Core::Result OffscreenRenderContext::Present()
    {
        if (!m_Recording)
        {
            Core::Log::Error("OffscreenRenderContext: Present without BeginFrame");
            return Core::Err(Core::ErrorCode::FrameNotStarted);
        }

        FrameSlot& frame = m_Frames[m_FrameIndex];
        m_Recording = false;
        m_Stream.reset();

        vkCmdEndRendering(frame.Cmd);
        RHI::CommandUtils::TransitionImageLayout(frame.Cmd, m_Target->GetHandle(),
                                                 VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                                                 VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);

        if (vkEndCommandBuffer(frame.Cmd) != VK_SUCCESS)
        {
            Core::Log::Error("OffscreenRenderContext: failed to end command buffer");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &frame.Cmd;

        m_TargetLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;

        VK_CHECK(vkResetFences(m_Device.GetLogicalDevice(), 1, &frame.InFlight));
        const VkResult submitted = m_Device.SubmitToGraphicsQueue(submitInfo, frame.InFlight);
        m_FrameIndex = (m_FrameIndex + 1) % static_cast<uint32_t>(m_Frames.size());

        if (submitted != VK_SUCCESS)
        {
            Core::Log::Error("OffscreenRenderContext: queue submission failed (VkResult={})", static_cast<int>(submitted));
            return Core::Err(submitted == VK_ERROR_DEVICE_LOST ? Core::ErrorCode::DeviceLost
                                                               : Core::ErrorCode::SubmissionFailed);
        }

        ++m_PresentedFrames;
        return Core::Ok();
    }

    Core::Expected<std::vector<uint8_t>> OffscreenRenderContext::ReadbackColor()
    {
        if (!m_IsValid || m_Recording || m_PresentedFrames == 0)
        {
            Core::Log::Error("OffscreenRenderContext: nothing to read back");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        m_Device.WaitIdle();

        const size_t sizeBytes = static_cast<size_t>(m_Config.Width) * m_Config.Height *
                                 RHI::GetColorTexelSize(m_Config.ColorFormat);
        RHI::VulkanBuffer readback(m_Device, sizeBytes, VK_BUFFER_USAGE_TRANSFER_DST_BIT, VMA_MEMORY_USAGE_GPU_TO_CPU);
        if (!readback.IsValid() || !readback.IsHostVisible())
        {
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);
        }

        auto copied = RHI::CommandUtils::ExecuteImmediate(m_Device, [&](VkCommandBuffer cmd)
        {
            VkBufferImageCopy region{};
            region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
            region.imageExtent = {m_Config.Width, m_Config.Height, 1};
            vkCmdCopyImageToBuffer(cmd, m_Target->GetHandle(), VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                                   readback.GetHandle(), 1, &region);
        });
        if (!copied)
        {
            return std::unexpected(copied.error());
        }

        readback.Invalidate(0, sizeBytes);
        std::vector<uint8_t> texels(sizeBytes);
        std::memcpy(texels.data(), readback.GetMappedData(), sizeBytes);
        return texels;
    }
}
