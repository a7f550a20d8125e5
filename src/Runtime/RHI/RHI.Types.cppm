module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

export module RHI:Types;

export namespace RHI
{
    // Fixed-function color combination applied when a fragment is written over the target.
    enum class BlendMode : uint8_t
    {
        Add = 0,
        Subtract,
        Alpha,
        Invert,
    };

    inline constexpr std::size_t kBlendModeCount = 4;

    inline constexpr std::array<BlendMode, kBlendModeCount> kAllBlendModes = {
        BlendMode::Add, BlendMode::Subtract, BlendMode::Alpha, BlendMode::Invert
    };

    [[nodiscard]] constexpr std::size_t ToIndex(BlendMode mode) noexcept
    {
        return static_cast<std::size_t>(mode);
    }

    [[nodiscard]] constexpr std::string_view ToString(BlendMode mode) noexcept
    {
        switch (mode)
        {
            case BlendMode::Add:      return "Add";
            case BlendMode::Subtract: return "Subtract";
            case BlendMode::Alpha:    return "Alpha";
            case BlendMode::Invert:   return "Invert";
        }
        return "Unknown";
    }

    // Everything the pipeline's color-blend stage needs for one blend mode.
    // Attachment state is applied to every color attachment of the pipeline.
    struct BlendState
    {
        VkPipelineColorBlendAttachmentState Attachment{};
        VkBool32 LogicOpEnable = VK_FALSE;
        VkLogicOp LogicOp = VK_LOGIC_OP_COPY;
        std::array<float, 4> BlendConstants = {1.0f, 1.0f, 1.0f, 1.0f};
    };

    [[nodiscard]] constexpr BlendState GetBlendState(BlendMode mode) noexcept
    {
        BlendState state{};
        state.Attachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                                          VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

        switch (mode)
        {
            case BlendMode::Add:
                state.Attachment.blendEnable = VK_TRUE;
                state.Attachment.colorBlendOp = VK_BLEND_OP_ADD;
                state.Attachment.srcColorBlendFactor = VK_BLEND_FACTOR_ONE;
                state.Attachment.dstColorBlendFactor = VK_BLEND_FACTOR_ONE;
                state.Attachment.alphaBlendOp = VK_BLEND_OP_ADD;
                state.Attachment.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
                state.Attachment.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
                break;
            case BlendMode::Subtract:
                state.Attachment.blendEnable = VK_TRUE;
                state.Attachment.colorBlendOp = VK_BLEND_OP_SUBTRACT;
                state.Attachment.srcColorBlendFactor = VK_BLEND_FACTOR_ONE;
                state.Attachment.dstColorBlendFactor = VK_BLEND_FACTOR_ONE;
                state.Attachment.alphaBlendOp = VK_BLEND_OP_SUBTRACT;
                state.Attachment.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
                state.Attachment.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
                break;
            case BlendMode::Alpha:
                // src * srcAlpha + dst * (1 - srcAlpha), same equation for alpha.
                state.Attachment.blendEnable = VK_TRUE;
                state.Attachment.colorBlendOp = VK_BLEND_OP_ADD;
                state.Attachment.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
                state.Attachment.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
                state.Attachment.alphaBlendOp = VK_BLEND_OP_ADD;
                state.Attachment.srcAlphaBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
                state.Attachment.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
                break;
            case BlendMode::Invert:
                // Logic ops replace blending entirely; attachment blending stays off.
                state.Attachment.blendEnable = VK_FALSE;
                state.LogicOpEnable = VK_TRUE;
                state.LogicOp = VK_LOGIC_OP_INVERT;
                break;
        }
        return state;
    }

    enum class VertexTopology : uint8_t
    {
        PointList,
        TriangleFan,
        TriangleList,
        TriangleStrip,
    };

    [[nodiscard]] constexpr VkPrimitiveTopology ToVkTopology(VertexTopology topology) noexcept
    {
        switch (topology)
        {
            case VertexTopology::PointList:     return VK_PRIMITIVE_TOPOLOGY_POINT_LIST;
            case VertexTopology::TriangleFan:   return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_FAN;
            case VertexTopology::TriangleList:  return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
            case VertexTopology::TriangleStrip: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP;
        }
        return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    }

    // Bytes per texel for the uncompressed color formats a render target can use; 0 for anything
    // else (depth/stencil, block-compressed, multi-planar).
    [[nodiscard]] constexpr uint32_t GetColorTexelSize(VkFormat format) noexcept
    {
        switch (format)
        {
            case VK_FORMAT_R8_UNORM:
            case VK_FORMAT_R8_SRGB:
                return 1;
            case VK_FORMAT_R8G8_UNORM:
            case VK_FORMAT_R16_SFLOAT:
            case VK_FORMAT_R5G6B5_UNORM_PACK16:
                return 2;
            case VK_FORMAT_R8G8B8A8_UNORM:
            case VK_FORMAT_R8G8B8A8_SRGB:
            case VK_FORMAT_B8G8R8A8_UNORM:
            case VK_FORMAT_B8G8R8A8_SRGB:
            case VK_FORMAT_A2B10G10R10_UNORM_PACK32:
            case VK_FORMAT_B10G11R11_UFLOAT_PACK32:
            case VK_FORMAT_R32_SFLOAT:
            case VK_FORMAT_R16G16_SFLOAT:
                return 4;
            case VK_FORMAT_R16G16B16A16_UNORM:
            case VK_FORMAT_R16G16B16A16_SFLOAT:
            case VK_FORMAT_R32G32_SFLOAT:
                return 8;
            case VK_FORMAT_R32G32B32A32_SFLOAT:
                return 16;
            default:
                return 0;
        }
    }

    struct VertexInputDescription
    {
        std::vector<VkVertexInputBindingDescription> Bindings;
        std::vector<VkVertexInputAttributeDescription> Attributes;
    };
}
