module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

export module Graphics:OffscreenRenderContext;

import RHI;
import Core;
import :DrawInfo;
import :RenderContext;

export namespace Graphics
{
    struct OffscreenTargetConfig
    {
        uint32_t Width = 800;
        uint32_t Height = 600;
        // Must be an uncompressed color format (RHI::GetColorTexelSize != 0); others are rejected.
        VkFormat ColorFormat = VK_FORMAT_R8G8B8A8_UNORM;
        // Initial size of each frame's vertex/instance upload page.
        VkDeviceSize UploadPageSize = 4ull * 1024ull * 1024ull;
    };

    // IRenderContext rendering into a device-local color image instead of a swapchain.
    // BeginFrame: wait frame slot -> begin command buffer -> dynamic rendering with clear.
    // Present:    end rendering -> submit with the slot's fence.
    class OffscreenRenderContext final : public IRenderContext
    {
    public:
        OffscreenRenderContext(RHI::VulkanDevice& device, const OffscreenTargetConfig& config);
        ~OffscreenRenderContext() override;

        OffscreenRenderContext(const OffscreenRenderContext&) = delete;
        OffscreenRenderContext& operator=(const OffscreenRenderContext&) = delete;

        [[nodiscard]] Core::Result BeginFrame(const Color& clearColor) override;
        [[nodiscard]] RHI::ICommandStream& GetCommandStream() override;
        [[nodiscard]] Core::Result Present() override;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] const RHI::VulkanImage& GetColorTarget() const { return *m_Target; }
        [[nodiscard]] uint64_t GetPresentedFrameCount() const { return m_PresentedFrames; }

        // Waits for the GPU, then copies the target into tightly packed texels
        // (RHI::GetColorTexelSize(ColorFormat) bytes each). Only valid outside BeginFrame/Present.
        [[nodiscard]] Core::Expected<std::vector<uint8_t>> ReadbackColor();

    private:
        struct FrameSlot
        {
            VkCommandBuffer Cmd = VK_NULL_HANDLE;
            VkFence InFlight = VK_NULL_HANDLE;
            std::unique_ptr<RHI::TransientAllocator> Uploads;
            std::unique_ptr<RHI::DescriptorAllocator> Descriptors;
        };

        RHI::VulkanDevice& m_Device;
        OffscreenTargetConfig m_Config;
        std::unique_ptr<RHI::VulkanImage> m_Target;
        VkImageLayout m_TargetLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        std::vector<FrameSlot> m_Frames;
        uint32_t m_FrameIndex = 0;
        uint64_t m_PresentedFrames = 0;

        std::unique_ptr<RHI::VulkanCommandStream> m_Stream;
        bool m_Recording = false;
        bool m_IsValid = true;
    };
}
