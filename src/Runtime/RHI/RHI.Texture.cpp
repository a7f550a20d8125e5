module;
#include <cstdint>
#include <memory>
#include <span>
#include "RHI.Vulkan.hpp"

module RHI:Texture.Impl;

import :Texture;
import :Buffer;
import :CommandUtils;
import :Device;
import :Image;
import Core;

namespace RHI
{
    Texture::Texture(VulkanDevice& device, std::span<const uint8_t> rgbaPixels, uint32_t width, uint32_t height)
        : m_Device(&device), m_Width(width), m_Height(height)
    {
        const size_t expected = static_cast<size_t>(width) * height * 4;
        if (width == 0 || height == 0 || rgbaPixels.size() != expected)
        {
            Core::Log::Error("Texture data size mismatch! got {} bytes, expected {} ({}x{} RGBA8)",
                             rgbaPixels.size(), expected, width, height);
            return;
        }

        Upload(rgbaPixels);
        if (m_View != VK_NULL_HANDLE)
        {
            CreateSampler();
        }
    }

    Texture::Texture(const ExternalBinding& external)
        : m_View(external.View), m_Sampler(external.Sampler), m_Width(external.Width), m_Height(external.Height)
    {
    }

    Texture::~Texture()
    {
        if (!m_Device || !m_Sampler) return;

        VkDevice logicalDevice = m_Device->GetLogicalDevice();
        VkSampler sampler = m_Sampler;
        m_Device->SafeDestroy([logicalDevice, sampler]()
        {
            vkDestroySampler(logicalDevice, sampler, nullptr);
        });
    }

    void Texture::CreateSampler()
    {
        // Nearest filtering keeps sprite texels crisp; clamp avoids bleeding across atlas borders.
        VkSamplerCreateInfo samplerInfo{};
        samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        samplerInfo.magFilter = VK_FILTER_NEAREST;
        samplerInfo.minFilter = VK_FILTER_NEAREST;
        samplerInfo.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
        samplerInfo.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.anisotropyEnable = VK_FALSE;
        samplerInfo.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
        samplerInfo.unnormalizedCoordinates = VK_FALSE;
        samplerInfo.compareEnable = VK_FALSE;
        samplerInfo.compareOp = VK_COMPARE_OP_ALWAYS;
        samplerInfo.minLod = 0.0f;
        samplerInfo.maxLod = 0.0f;

        if (vkCreateSampler(m_Device->GetLogicalDevice(), &samplerInfo, nullptr, &m_Sampler) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create texture sampler!");
            m_Sampler = VK_NULL_HANDLE;
        }
    }

    void Texture::Upload(std::span<const uint8_t> rgbaPixels)
    {
        VulkanBuffer stagingBuffer(*m_Device, rgbaPixels.size(), VK_BUFFER_USAGE_TRANSFER_SRC_BIT, VMA_MEMORY_USAGE_CPU_ONLY);
        if (!stagingBuffer.IsValid() || !stagingBuffer.Write(rgbaPixels.data(), rgbaPixels.size()))
        {
            Core::Log::Error("Texture upload: staging buffer unavailable ({} bytes).", rgbaPixels.size());
            return;
        }

        m_Image = std::make_unique<VulkanImage>(
            *m_Device, m_Width, m_Height, VK_FORMAT_R8G8B8A8_SRGB,
            VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT);
        if (!m_Image->IsValid())
        {
            m_Image.reset();
            return;
        }

        auto uploaded = CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
        {
            CommandUtils::TransitionImageLayout(cmd, m_Image->GetHandle(),
                                                VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

            VkBufferImageCopy region{};
            region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
            region.imageExtent = {m_Width, m_Height, 1};
            vkCmdCopyBufferToImage(cmd, stagingBuffer.GetHandle(), m_Image->GetHandle(),
                                   VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

            CommandUtils::TransitionImageLayout(cmd, m_Image->GetHandle(),
                                                VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        });

        if (!uploaded)
        {
            Core::Log::Error("Texture upload failed: {}", Core::ErrorCodeToString(uploaded.error()));
            m_Image.reset();
            return;
        }

        m_View = m_Image->GetView();
    }
}
