#include <gtest/gtest.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "RHI.Vulkan.hpp"

import RHI;
import Core;
import Graphics;

#ifndef LEDGE_SHADER_DIR
#define LEDGE_SHADER_DIR "shaders"
#endif

namespace {

constexpr uint32_t kTargetSize = 64;

class OffscreenRenderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const std::filesystem::path shaderDir(LEDGE_SHADER_DIR);
        if (!std::filesystem::exists(shaderDir / "sprite.vert.spv") ||
            !std::filesystem::exists(shaderDir / "sprite.frag.spv"))
        {
            GTEST_SKIP() << "Sprite SPIR-V not built in " << shaderDir;
        }

        m_Context = std::make_unique<RHI::VulkanContext>(RHI::ContextConfig{
            .AppName = "OffscreenRenderTest",
            .EnableValidation = true,
            .Headless = true,
        });
        if (!m_Context->IsValid())
        {
            GTEST_SKIP() << "No Vulkan instance available";
        }

        m_Device = std::make_unique<RHI::VulkanDevice>(*m_Context);
        if (!m_Device->IsValid())
        {
            GTEST_SKIP() << "No Vulkan 1.3 device available";
        }

        m_VertexShader = std::make_unique<RHI::ShaderModule>(
            *m_Device, (shaderDir / "sprite.vert.spv").string(), RHI::ShaderStage::Vertex);
        m_FragmentShader = std::make_unique<RHI::ShaderModule>(
            *m_Device, (shaderDir / "sprite.frag.spv").string(), RHI::ShaderStage::Fragment);
        ASSERT_TRUE(m_VertexShader->IsValid());
        ASSERT_TRUE(m_FragmentShader->IsValid());

        m_Target = std::make_unique<Graphics::OffscreenRenderContext>(
            *m_Device, Graphics::OffscreenTargetConfig{.Width = kTargetSize, .Height = kTargetSize});
        ASSERT_TRUE(m_Target->IsValid());

        auto factory = std::make_unique<Graphics::SpritePipelineFactory>(*m_Device, Graphics::SpritePipelineConfig{
            .VertexShader = m_VertexShader.get(),
            .FragmentShader = m_FragmentShader.get(),
        });
        auto program = Graphics::ShaderProgram::Create(std::move(factory), RHI::BlendMode::Alpha);
        ASSERT_TRUE(program.has_value());
        m_Shader = m_Renderer.RegisterShader(std::move(*program));

        const std::vector<uint8_t> white = {255, 255, 255, 255};
        m_White = std::make_shared<const RHI::Texture>(*m_Device, white, 1u, 1u);
        ASSERT_TRUE(m_White->IsValid());
    }

    void TearDown() override
    {
        if (m_Device && m_Device->IsValid()) m_Device->WaitIdle();
        m_White.reset();
        m_Target.reset();
        m_Renderer = Graphics::Renderer{};
        m_FragmentShader.reset();
        m_VertexShader.reset();
        m_Device.reset();
        m_Context.reset();
    }

    // Full-target quad: unit quad scaled to 2 and moved to (-1, -1).
    Graphics::SpriteBatch MakeFullscreenBatch() const
    {
        Graphics::SpriteBatch batch(m_White);
        batch.Insert(Graphics::DrawInfo{}.Scale(2.0f).Translate(-1.0f, -1.0f, 0.0f));
        return batch;
    }

    std::vector<uint8_t> CenterTexel()
    {
        auto texels = m_Target->ReadbackColor();
        EXPECT_TRUE(texels.has_value());
        if (!texels) return {};
        const size_t index = (static_cast<size_t>(kTargetSize / 2) * kTargetSize + kTargetSize / 2) * 4;
        return {texels->begin() + index, texels->begin() + index + 4};
    }

    static void ExpectTexelNear(const std::vector<uint8_t>& actual, const std::vector<uint8_t>& expected,
                                int tolerance, size_t channels = 4)
    {
        ASSERT_EQ(actual.size(), 4u);
        for (size_t i = 0; i < channels; ++i)
        {
            EXPECT_LE(std::abs(int(actual[i]) - int(expected[i])), tolerance) << "channel " << i;
        }
    }

    std::unique_ptr<RHI::VulkanContext> m_Context;
    std::unique_ptr<RHI::VulkanDevice> m_Device;
    std::unique_ptr<RHI::ShaderModule> m_VertexShader;
    std::unique_ptr<RHI::ShaderModule> m_FragmentShader;
    std::unique_ptr<Graphics::OffscreenRenderContext> m_Target;
    std::shared_ptr<const RHI::Texture> m_White;

    Graphics::Renderer m_Renderer;
    Graphics::ShaderId m_Shader = 0;
};

} // namespace

TEST_F(OffscreenRenderTest, ReadbackBeforeAnyFrameFails)
{
    auto texels = m_Target->ReadbackColor();
    ASSERT_FALSE(texels.has_value());
    EXPECT_EQ(texels.error(), Core::ErrorCode::InvalidState);
}

TEST_F(OffscreenRenderTest, EmptyFrameKeepsClearColor)
{
    ASSERT_TRUE(m_Renderer.BeginFrame(*m_Target, Graphics::Color::Grey()).has_value());
    ASSERT_TRUE(m_Renderer.Present(*m_Target).has_value());

    ExpectTexelNear(CenterTexel(), Graphics::Color::Grey().AsU8Vector(), 1);
}

TEST_F(OffscreenRenderTest, EveryBlendModeCoversBlackWithWhite)
{
    Graphics::ShaderProgram* shader = m_Renderer.GetShader(m_Shader);
    for (RHI::BlendMode mode : RHI::kAllBlendModes)
    {
        ASSERT_TRUE(shader->BuildPipeline(mode).has_value()) << RHI::ToString(mode);
    }

    const Graphics::SpriteBatch batch = MakeFullscreenBatch();
    for (RHI::BlendMode mode : RHI::kAllBlendModes)
    {
        shader->SetCurrentMode(mode);
        ASSERT_TRUE(m_Renderer.BeginFrame(*m_Target, Graphics::Color::Black()).has_value());
        ASSERT_TRUE(m_Renderer.Draw(*m_Target, batch).has_value()) << RHI::ToString(mode);
        ASSERT_TRUE(m_Renderer.Present(*m_Target).has_value());

        // RGB only: add 1 + 0, subtract 1 - 0, alpha source over, invert ~0.
        // Alpha differs per mode (subtract and invert both end at 0 over an opaque clear).
        SCOPED_TRACE(std::string(RHI::ToString(mode)));
        ExpectTexelNear(CenterTexel(), {255, 255, 255, 255}, 1, 3);
    }

    EXPECT_EQ(m_Target->GetPresentedFrameCount(), RHI::kBlendModeCount);
}

TEST_F(OffscreenRenderTest, BatchTintReachesTheTarget)
{
    const Graphics::SpriteBatch batch = MakeFullscreenBatch();

    ASSERT_TRUE(m_Renderer.BeginFrame(*m_Target, Graphics::Color::Black()).has_value());
    ASSERT_TRUE(m_Renderer.Draw(*m_Target, batch, Graphics::DrawInfo::WithColor(Graphics::Color::Red())).has_value());
    ASSERT_TRUE(m_Renderer.Present(*m_Target).has_value());

    ExpectTexelNear(CenterTexel(), {255, 13, 13, 255}, 2);
}

TEST_F(OffscreenRenderTest, UnbuiltModeAbortsFrameButPresentSucceeds)
{
    m_Renderer.GetShader(m_Shader)->SetCurrentMode(RHI::BlendMode::Subtract);
    const Graphics::SpriteBatch batch = MakeFullscreenBatch();

    ASSERT_TRUE(m_Renderer.BeginFrame(*m_Target, Graphics::Color::Black()).has_value());
    auto drawn = m_Renderer.Draw(*m_Target, batch);
    ASSERT_FALSE(drawn.has_value());
    EXPECT_EQ(drawn.error(), Core::ErrorCode::PipelineNotRegistered);
    ASSERT_TRUE(m_Renderer.Present(*m_Target).has_value());

    ExpectTexelNear(CenterTexel(), {0, 0, 0, 255}, 0);
}

TEST_F(OffscreenRenderTest, ManyFramesCycleFrameSlots)
{
    const Graphics::SpriteBatch batch = MakeFullscreenBatch();
    for (int frame = 0; frame < 8; ++frame)
    {
        ASSERT_TRUE(m_Renderer.BeginFrame(*m_Target, Graphics::Color::Black()).has_value()) << "frame " << frame;
        ASSERT_TRUE(m_Renderer.Draw(*m_Target, batch).has_value());
        ASSERT_TRUE(m_Renderer.Present(*m_Target).has_value());
    }
    EXPECT_EQ(m_Target->GetPresentedFrameCount(), 8u);
    ExpectTexelNear(CenterTexel(), {255, 255, 255, 255}, 1);
}

TEST_F(OffscreenRenderTest, ReadbackSizeFollowsColorFormat)
{
    Graphics::OffscreenRenderContext wide(*m_Device, Graphics::OffscreenTargetConfig{
        .Width = 16,
        .Height = 8,
        .ColorFormat = VK_FORMAT_R16G16B16A16_SFLOAT,
    });
    ASSERT_TRUE(wide.IsValid());

    ASSERT_TRUE(wide.BeginFrame(Graphics::Color::White()).has_value());
    ASSERT_TRUE(wide.Present().has_value());

    auto texels = wide.ReadbackColor();
    ASSERT_TRUE(texels.has_value());
    EXPECT_EQ(texels->size(), 16u * 8u * 8u);
}

TEST_F(OffscreenRenderTest, CompressedColorFormatIsRejected)
{
    Graphics::OffscreenRenderContext compressed(*m_Device, Graphics::OffscreenTargetConfig{
        .Width = 16,
        .Height = 16,
        .ColorFormat = VK_FORMAT_BC1_RGB_UNORM_BLOCK,
    });
    EXPECT_FALSE(compressed.IsValid());

    auto begun = compressed.BeginFrame(Graphics::Color::Black());
    ASSERT_FALSE(begun.has_value());
    EXPECT_EQ(begun.error(), Core::ErrorCode::InvalidState);

    auto texels = compressed.ReadbackColor();
    ASSERT_FALSE(texels.has_value());
    EXPECT_EQ(texels.error(), Core::ErrorCode::InvalidState);
}
