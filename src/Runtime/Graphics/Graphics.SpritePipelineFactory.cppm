module;
#include "RHI.Vulkan.hpp"
#include <memory>

export module Graphics:SpritePipelineFactory;

import RHI;
import Core;
import :ShaderProgram;

export namespace Graphics
{
    struct SpritePipelineConfig
    {
        // Borrowed; must outlive the factory (and so the ShaderProgram owning it).
        const RHI::ShaderModule* VertexShader = nullptr;
        const RHI::ShaderModule* FragmentShader = nullptr;

        RHI::VertexTopology Topology = RHI::VertexTopology::TriangleStrip;
        VkFormat ColorFormat = VK_FORMAT_R8G8B8A8_UNORM;

        // Set 0. VK_NULL_HANDLE: the factory supplies an empty layout.
        VkDescriptorSetLayout GlobalSetLayout = VK_NULL_HANDLE;
    };

    // Sprite pipelines: quad + instance streams, set 1 binding 0 = combined image sampler.
    class SpritePipelineFactory final : public IPipelineFactory
    {
    public:
        SpritePipelineFactory(RHI::VulkanDevice& device, const SpritePipelineConfig& config);

        [[nodiscard]] Core::Expected<PipelinePtr> Build(RHI::BlendMode mode) override;

        [[nodiscard]] VkDescriptorSetLayout GetTextureSetLayout() const { return m_TextureLayout->GetHandle(); }

    private:
        RHI::VulkanDevice& m_Device;
        SpritePipelineConfig m_Config;
        std::unique_ptr<RHI::DescriptorLayout> m_EmptyGlobalLayout;
        std::unique_ptr<RHI::DescriptorLayout> m_TextureLayout;
    };
}
