module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>
#include <vector>

export module RHI:Pipeline;

import :Types;
import :Device;
import :Shader;
import Core;

export namespace RHI
{
    // A compiled graphics pipeline plus the layout it was built against.
    // A null `device` means nothing is owned (used by CPU-side tests that fabricate handles).
    class GraphicsPipeline
    {
    public:
        GraphicsPipeline(VulkanDevice* device,
                         VkPipeline pipeline,
                         VkPipelineLayout layout,
                         std::vector<VkDescriptorSetLayout> setLayouts = {});
        ~GraphicsPipeline();

        GraphicsPipeline(const GraphicsPipeline&) = delete;
        GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }

        // Layouts are borrowed; whoever created them keeps them alive for the pipeline's lifetime.
        [[nodiscard]] VkDescriptorSetLayout GetSetLayout(uint32_t setIndex) const
        {
            return setIndex < m_SetLayouts.size() ? m_SetLayouts[setIndex] : VK_NULL_HANDLE;
        }
        [[nodiscard]] uint32_t GetSetLayoutCount() const { return static_cast<uint32_t>(m_SetLayouts.size()); }

    private:
        VulkanDevice* m_Device = nullptr;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
        std::vector<VkDescriptorSetLayout> m_SetLayouts;
    };

    // Dynamic-rendering pipeline builder. Viewport and scissor are always dynamic state;
    // the color-blend stage comes from GetBlendState(mode).
    class PipelineBuilder
    {
    public:
        explicit PipelineBuilder(VulkanDevice& device);

        PipelineBuilder& SetShaders(const ShaderModule* vertex, const ShaderModule* fragment);
        PipelineBuilder& SetInputLayout(const VertexInputDescription& input);
        PipelineBuilder& SetTopology(VertexTopology topology);
        PipelineBuilder& SetBlendMode(BlendMode mode);
        PipelineBuilder& SetColorFormats(const std::vector<VkFormat>& formats);

        // Set layouts are consumed in call order: the first call is set 0.
        PipelineBuilder& AddDescriptorSetLayout(VkDescriptorSetLayout layout);

        [[nodiscard]] Core::Expected<std::unique_ptr<GraphicsPipeline>> Build() const;

    private:
        VulkanDevice& m_Device;

        const ShaderModule* m_VertexShader = nullptr;
        const ShaderModule* m_FragmentShader = nullptr;
        VertexInputDescription m_Input;
        VertexTopology m_Topology = VertexTopology::TriangleStrip;
        BlendMode m_BlendMode = BlendMode::Alpha;
        std::vector<VkFormat> m_ColorFormats;

        std::vector<VkDescriptorSetLayout> m_SetLayouts;
    };
}
