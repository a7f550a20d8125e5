module;
#include "RHI.Vulkan.hpp"
#include <expected>
#include <memory>
#include <span>
#include <utility>
#include <vector>

module Graphics:SpritePipelineFactory.Impl;

import RHI;
import Core;
import :SpritePipelineFactory;
import :ShaderProgram;
import :SpriteVertex;

namespace Graphics
{
    SpritePipelineFactory::SpritePipelineFactory(RHI::VulkanDevice& device, const SpritePipelineConfig& config)
        : m_Device(device), m_Config(config)
    {
        if (m_Config.GlobalSetLayout == VK_NULL_HANDLE)
        {
            m_EmptyGlobalLayout = std::make_unique<RHI::DescriptorLayout>(
                m_Device, std::span<const VkDescriptorSetLayoutBinding>{});
        }

        VkDescriptorSetLayoutBinding textureBinding{};
        textureBinding.binding = 0;
        textureBinding.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        textureBinding.descriptorCount = 1;
        textureBinding.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;

        m_TextureLayout = std::make_unique<RHI::DescriptorLayout>(
            m_Device, std::span<const VkDescriptorSetLayoutBinding>(&textureBinding, 1));
    }

    Core::Expected<PipelinePtr> SpritePipelineFactory::Build(RHI::BlendMode mode)
    {
        const VkDescriptorSetLayout globalLayout = m_EmptyGlobalLayout
                                                       ? m_EmptyGlobalLayout->GetHandle()
                                                       : m_Config.GlobalSetLayout;
        if (globalLayout == VK_NULL_HANDLE || !m_TextureLayout->IsValid())
        {
            Core::Log::Error("SpritePipelineFactory: descriptor set layouts unavailable, cannot build {}",
                             RHI::ToString(mode));
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        RHI::PipelineBuilder builder(m_Device);
        builder.SetShaders(m_Config.VertexShader, m_Config.FragmentShader)
               .SetInputLayout(GetSpriteVertexInput())
               .SetTopology(m_Config.Topology)
               .SetBlendMode(mode)
               .SetColorFormats({m_Config.ColorFormat})
               .AddDescriptorSetLayout(globalLayout)
               .AddDescriptorSetLayout(m_TextureLayout->GetHandle());

        auto built = builder.Build();
        if (!built)
        {
            return std::unexpected(built.error());
        }

        Core::Log::Info("SpritePipelineFactory: compiled {} pipeline", RHI::ToString(mode));
        return PipelinePtr(std::move(*built));
    }
}
