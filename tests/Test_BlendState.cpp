#include <gtest/gtest.h>

#include "RHI.Vulkan.hpp"

import RHI;

namespace {

constexpr VkColorComponentFlags kAllChannels =
    VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

} // namespace

TEST(BlendState, AddIsOnePlusOne)
{
    constexpr RHI::BlendState s = RHI::GetBlendState(RHI::BlendMode::Add);
    EXPECT_EQ(s.Attachment.blendEnable, VK_TRUE);
    EXPECT_EQ(s.Attachment.colorBlendOp, VK_BLEND_OP_ADD);
    EXPECT_EQ(s.Attachment.srcColorBlendFactor, VK_BLEND_FACTOR_ONE);
    EXPECT_EQ(s.Attachment.dstColorBlendFactor, VK_BLEND_FACTOR_ONE);
    EXPECT_EQ(s.Attachment.alphaBlendOp, VK_BLEND_OP_ADD);
    EXPECT_EQ(s.Attachment.srcAlphaBlendFactor, VK_BLEND_FACTOR_ONE);
    EXPECT_EQ(s.Attachment.dstAlphaBlendFactor, VK_BLEND_FACTOR_ONE);
    EXPECT_EQ(s.LogicOpEnable, VK_FALSE);
}

TEST(BlendState, SubtractIsSourceMinusDestination)
{
    constexpr RHI::BlendState s = RHI::GetBlendState(RHI::BlendMode::Subtract);
    EXPECT_EQ(s.Attachment.blendEnable, VK_TRUE);
    EXPECT_EQ(s.Attachment.colorBlendOp, VK_BLEND_OP_SUBTRACT);
    EXPECT_EQ(s.Attachment.alphaBlendOp, VK_BLEND_OP_SUBTRACT);
    EXPECT_EQ(s.Attachment.srcColorBlendFactor, VK_BLEND_FACTOR_ONE);
    EXPECT_EQ(s.Attachment.dstColorBlendFactor, VK_BLEND_FACTOR_ONE);
    EXPECT_EQ(s.LogicOpEnable, VK_FALSE);
}

TEST(BlendState, AlphaIsSourceOver)
{
    constexpr RHI::BlendState s = RHI::GetBlendState(RHI::BlendMode::Alpha);
    EXPECT_EQ(s.Attachment.blendEnable, VK_TRUE);
    EXPECT_EQ(s.Attachment.colorBlendOp, VK_BLEND_OP_ADD);
    EXPECT_EQ(s.Attachment.srcColorBlendFactor, VK_BLEND_FACTOR_SRC_ALPHA);
    EXPECT_EQ(s.Attachment.dstColorBlendFactor, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA);
    EXPECT_EQ(s.Attachment.srcAlphaBlendFactor, VK_BLEND_FACTOR_SRC_ALPHA);
    EXPECT_EQ(s.Attachment.dstAlphaBlendFactor, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA);
}

TEST(BlendState, InvertUsesLogicOpInsteadOfBlending)
{
    constexpr RHI::BlendState s = RHI::GetBlendState(RHI::BlendMode::Invert);
    EXPECT_EQ(s.Attachment.blendEnable, VK_FALSE);
    EXPECT_EQ(s.LogicOpEnable, VK_TRUE);
    EXPECT_EQ(s.LogicOp, VK_LOGIC_OP_INVERT);
}

TEST(BlendState, EveryModeWritesAllChannels)
{
    for (RHI::BlendMode mode : RHI::kAllBlendModes)
    {
        EXPECT_EQ(RHI::GetBlendState(mode).Attachment.colorWriteMask, kAllChannels) << RHI::ToString(mode);
    }
}

TEST(BlendState, ModesHaveDistinctDenseIndices)
{
    static_assert(RHI::kAllBlendModes.size() == RHI::kBlendModeCount);
    for (std::size_t i = 0; i < RHI::kBlendModeCount; ++i)
    {
        EXPECT_EQ(RHI::ToIndex(RHI::kAllBlendModes[i]), i);
    }
    EXPECT_EQ(RHI::ToString(RHI::BlendMode::Add), "Add");
    EXPECT_EQ(RHI::ToString(RHI::BlendMode::Invert), "Invert");
}

TEST(VertexTopology, MapsToVulkanPrimitiveTopology)
{
    EXPECT_EQ(RHI::ToVkTopology(RHI::VertexTopology::PointList), VK_PRIMITIVE_TOPOLOGY_POINT_LIST);
    EXPECT_EQ(RHI::ToVkTopology(RHI::VertexTopology::TriangleFan), VK_PRIMITIVE_TOPOLOGY_TRIANGLE_FAN);
    EXPECT_EQ(RHI::ToVkTopology(RHI::VertexTopology::TriangleList), VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST);
    EXPECT_EQ(RHI::ToVkTopology(RHI::VertexTopology::TriangleStrip), VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP);
}

TEST(ColorTexelSize, CoversRenderTargetFormats)
{
    static_assert(RHI::GetColorTexelSize(VK_FORMAT_R8G8B8A8_UNORM) == 4);
    EXPECT_EQ(RHI::GetColorTexelSize(VK_FORMAT_B8G8R8A8_SRGB), 4u);
    EXPECT_EQ(RHI::GetColorTexelSize(VK_FORMAT_R16G16B16A16_SFLOAT), 8u);
    EXPECT_EQ(RHI::GetColorTexelSize(VK_FORMAT_R32G32B32A32_SFLOAT), 16u);
    EXPECT_EQ(RHI::GetColorTexelSize(VK_FORMAT_R8_UNORM), 1u);
}

TEST(ColorTexelSize, RejectsNonColorAndCompressedFormats)
{
    EXPECT_EQ(RHI::GetColorTexelSize(VK_FORMAT_UNDEFINED), 0u);
    EXPECT_EQ(RHI::GetColorTexelSize(VK_FORMAT_D32_SFLOAT), 0u);
    EXPECT_EQ(RHI::GetColorTexelSize(VK_FORMAT_BC1_RGB_UNORM_BLOCK), 0u);
}
