module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <utility>
#include <vector>

module RHI:Pipeline.Impl;

import :Pipeline;
import :Types;
import :Device;
import :Shader;
import Core;

namespace RHI
{
    GraphicsPipeline::GraphicsPipeline(VulkanDevice* device,
                                       VkPipeline pipeline,
                                       VkPipelineLayout layout,
                                       std::vector<VkDescriptorSetLayout> setLayouts)
        : m_Device(device), m_Pipeline(pipeline), m_Layout(layout), m_SetLayouts(std::move(setLayouts))
    {
    }

    GraphicsPipeline::~GraphicsPipeline()
    {
        if (!m_Device) return;

        // A command buffer from the frame in flight may still reference the pipeline.
        VkDevice logicalDevice = m_Device->GetLogicalDevice();
        VkPipeline pipeline = m_Pipeline;
        VkPipelineLayout layout = m_Layout;
        m_Device->SafeDestroy([logicalDevice, pipeline, layout]()
        {
            if (pipeline) vkDestroyPipeline(logicalDevice, pipeline, nullptr);
            if (layout) vkDestroyPipelineLayout(logicalDevice, layout, nullptr);
        });
    }

    PipelineBuilder::PipelineBuilder(VulkanDevice& device)
        : m_Device(device)
    {
    }

    PipelineBuilder& PipelineBuilder::SetShaders(const ShaderModule* vertex, const ShaderModule* fragment)
    {
        m_VertexShader = vertex;
        m_FragmentShader = fragment;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::SetInputLayout(const VertexInputDescription& input)
    {
        m_Input = input;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::SetTopology(VertexTopology topology)
    {
        m_Topology = topology;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::SetBlendMode(BlendMode mode)
    {
        m_BlendMode = mode;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::SetColorFormats(const std::vector<VkFormat>& formats)
    {
        m_ColorFormats = formats;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::AddDescriptorSetLayout(VkDescriptorSetLayout layout)
    {
        m_SetLayouts.push_back(layout);
        return *this;
    }

    Core::Expected<std::unique_ptr<GraphicsPipeline>> PipelineBuilder::Build() const
    {
        if (!m_VertexShader || !m_FragmentShader || !m_VertexShader->IsValid() || !m_FragmentShader->IsValid())
        {
            Core::Log::Error("PipelineBuilder: missing or invalid shader modules.");
            return std::unexpected(Core::ErrorCode::ShaderModuleInvalid);
        }
        if (m_ColorFormats.empty())
        {
            Core::Log::Error("PipelineBuilder: no color attachment formats set.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        VkDevice device = m_Device.GetLogicalDevice();

        // 1. Layout
        VkPipelineLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        layoutInfo.setLayoutCount = static_cast<uint32_t>(m_SetLayouts.size());
        layoutInfo.pSetLayouts = m_SetLayouts.data();

        VkPipelineLayout layout = VK_NULL_HANDLE;
        if (vkCreatePipelineLayout(device, &layoutInfo, nullptr, &layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create pipeline layout!");
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        // 2. Shaders
        const std::array<VkPipelineShaderStageCreateInfo, 2> stages = {
            m_VertexShader->GetStageInfo(),
            m_FragmentShader->GetStageInfo()
        };

        // 3. Vertex input
        VkPipelineVertexInputStateCreateInfo vertexInput{};
        vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vertexInput.vertexBindingDescriptionCount = static_cast<uint32_t>(m_Input.Bindings.size());
        vertexInput.pVertexBindingDescriptions = m_Input.Bindings.data();
        vertexInput.vertexAttributeDescriptionCount = static_cast<uint32_t>(m_Input.Attributes.size());
        vertexInput.pVertexAttributeDescriptions = m_Input.Attributes.data();

        VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
        inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        inputAssembly.topology = ToVkTopology(m_Topology);
        inputAssembly.primitiveRestartEnable = VK_FALSE;

        // 4. Viewport & Scissor (Dynamic State)
        VkPipelineViewportStateCreateInfo viewportState{};
        viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewportState.viewportCount = 1;
        viewportState.scissorCount = 1;

        // 5. Rasterizer
        VkPipelineRasterizationStateCreateInfo rasterizer{};
        rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rasterizer.depthClampEnable = VK_FALSE;
        rasterizer.rasterizerDiscardEnable = VK_FALSE;
        rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
        rasterizer.lineWidth = 1.0f;
        // Mirrored sprites (negative scale) flip winding; never cull.
        rasterizer.cullMode = VK_CULL_MODE_NONE;
        rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

        VkPipelineMultisampleStateCreateInfo multisampling{};
        multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        multisampling.sampleShadingEnable = VK_FALSE;
        multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

        // 6. Color Blending
        const BlendState blend = GetBlendState(m_BlendMode);
        const std::vector<VkPipelineColorBlendAttachmentState> attachments(m_ColorFormats.size(), blend.Attachment);

        VkPipelineColorBlendStateCreateInfo colorBlending{};
        colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        colorBlending.logicOpEnable = blend.LogicOpEnable;
        colorBlending.logicOp = blend.LogicOp;
        colorBlending.attachmentCount = static_cast<uint32_t>(attachments.size());
        colorBlending.pAttachments = attachments.data();
        for (size_t i = 0; i < blend.BlendConstants.size(); ++i)
            colorBlending.blendConstants[i] = blend.BlendConstants[i];

        // 7. Dynamic States
        const std::array<VkDynamicState, 2> dynamicStates = {
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR
        };
        VkPipelineDynamicStateCreateInfo dynamicState{};
        dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dynamicState.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
        dynamicState.pDynamicStates = dynamicStates.data();

        // Sprites are layered by submission order, no depth attachment.
        VkPipelineDepthStencilStateCreateInfo depthStencil{};
        depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        depthStencil.depthTestEnable = VK_FALSE;
        depthStencil.depthWriteEnable = VK_FALSE;
        depthStencil.stencilTestEnable = VK_FALSE;

        VkPipelineRenderingCreateInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
        renderingInfo.colorAttachmentCount = static_cast<uint32_t>(m_ColorFormats.size());
        renderingInfo.pColorAttachmentFormats = m_ColorFormats.data();
        renderingInfo.depthAttachmentFormat = VK_FORMAT_UNDEFINED;

        // 8. Create
        VkGraphicsPipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        pipelineInfo.pNext = &renderingInfo;
        pipelineInfo.stageCount = static_cast<uint32_t>(stages.size());
        pipelineInfo.pStages = stages.data();
        pipelineInfo.pVertexInputState = &vertexInput;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.pDynamicState = &dynamicState;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.layout = layout;
        pipelineInfo.renderPass = VK_NULL_HANDLE;
        pipelineInfo.subpass = 0;

        VkPipeline pipeline = VK_NULL_HANDLE;
        const VkResult result = vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create graphics pipeline (blend={}, VkResult={})",
                             ToString(m_BlendMode), static_cast<int>(result));
            vkDestroyPipelineLayout(device, layout, nullptr);
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        return std::make_unique<GraphicsPipeline>(&m_Device, pipeline, layout, m_SetLayouts);
    }
}
