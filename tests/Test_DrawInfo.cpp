#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <limits>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

import RHI;
import Graphics;

TEST(Color, NamedConstants)
{
    EXPECT_EQ(Graphics::Color::White().AsArray(), (std::array<float, 4>{1.0f, 1.0f, 1.0f, 1.0f}));
    EXPECT_EQ(Graphics::Color::Black().AsArray(), (std::array<float, 4>{0.0f, 0.0f, 0.0f, 1.0f}));
    EXPECT_EQ(Graphics::Color::Grey().AsArray(), (std::array<float, 4>{0.25f, 0.25f, 0.25f, 1.0f}));
    EXPECT_EQ(Graphics::Color::Red().AsArray(), (std::array<float, 4>{1.0f, 0.05f, 0.05f, 1.0f}));
    EXPECT_EQ(Graphics::Color::Transparent().AsArray(), (std::array<float, 4>{0.0f, 0.0f, 0.0f, 0.0f}));
    EXPECT_EQ(Graphics::Color{}, Graphics::Color::White());
}

TEST(Color, RgbaNormalizesBytes)
{
    constexpr Graphics::Color c = Graphics::Color::Rgba(255, 0, 51, 255);
    EXPECT_FLOAT_EQ(c.R, 1.0f);
    EXPECT_FLOAT_EQ(c.G, 0.0f);
    EXPECT_FLOAT_EQ(c.B, 0.2f);
    EXPECT_FLOAT_EQ(c.A, 1.0f);
}

TEST(Color, U8ConversionTruncates)
{
    // 0.25 * 255 = 63.75 -> 63
    EXPECT_EQ(Graphics::Color::Grey().AsU8Array(), (std::array<uint8_t, 4>{63, 63, 63, 255}));
    // 0.05 * 255 = 12.75 -> 12
    EXPECT_EQ(Graphics::Color::Red().AsU8Vector(), (std::vector<uint8_t>{255, 12, 12, 255}));
}

TEST(Color, U8ConversionSaturatesOutOfRange)
{
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const Graphics::Color c{.R = 2.0f, .G = -1.0f, .B = nan, .A = 1.0f};
    EXPECT_EQ(c.AsU8Array(), (std::array<uint8_t, 4>{255, 0, 0, 255}));
}

TEST(Rect, DefaultCoversWholeTexture)
{
    EXPECT_EQ(Graphics::Rect{}.AsArray(), (std::array<float, 4>{0.0f, 0.0f, 1.0f, 1.0f}));
    EXPECT_EQ((Graphics::Rect{0.5f, 0.25f, 0.5f, 0.25f}.AsArray()), (std::array<float, 4>{0.5f, 0.25f, 0.5f, 0.25f}));
}

TEST(DrawInfo, DefaultsAreFullRectWhiteIdentity)
{
    const Graphics::DrawInfo info;
    EXPECT_EQ(info.SourceRect, Graphics::Rect{});
    EXPECT_EQ(info.Tint, Graphics::Color::White());
    EXPECT_EQ(info.Pose, Graphics::Transform::Identity());
}

TEST(DrawInfo, WithConstructorsChangeOneField)
{
    const Graphics::Rect rect{0.0f, 0.0f, 0.5f, 0.5f};
    const auto withRect = Graphics::DrawInfo::WithRect(rect);
    EXPECT_EQ(withRect.SourceRect, rect);
    EXPECT_EQ(withRect.Tint, Graphics::Color::White());

    const auto withColor = Graphics::DrawInfo::WithColor(Graphics::Color::Red());
    EXPECT_EQ(withColor.Tint, Graphics::Color::Red());
    EXPECT_EQ(withColor.SourceRect, Graphics::Rect{});

    const auto pose = Graphics::Transform::FromMatrix(glm::mat4(2.0f));
    const auto withPose = Graphics::DrawInfo::WithTransform(pose);
    EXPECT_EQ(withPose.Pose, pose);
}

TEST(DrawInfo, MutatorsChainAndForwardToPose)
{
    Graphics::DrawInfo info;
    info.Scale(0.5f).Translate(1.0f, 2.0f, 0.0f).RotateValue(0.3f).Rotate(0.0f, 0.0f, 0.2f);

    const auto& c = std::get<Graphics::TransformComponents>(info.Pose.GetShape());
    EXPECT_EQ(c.Scale, glm::vec3(0.5f));
    EXPECT_EQ(c.Position, glm::vec3(1.0f, 2.0f, 0.0f));
    EXPECT_FLOAT_EQ(c.Rotation, 0.5f);

    info.NonUniformScale(1.0f, 2.0f, 3.0f).Destination(-1.0f, -1.0f, 0.0f);
    const auto& after = std::get<Graphics::TransformComponents>(info.Pose.GetShape());
    EXPECT_EQ(after.Scale, glm::vec3(1.0f, 2.0f, 3.0f));
    EXPECT_EQ(after.Position, glm::vec3(-1.0f, -1.0f, 0.0f));
}

TEST(DrawInfo, ResetRestoresDefaults)
{
    auto info = Graphics::DrawInfo::WithColor(Graphics::Color::Red());
    info.SourceRect = {0.1f, 0.1f, 0.1f, 0.1f};
    info.Translate(3.0f, 3.0f, 3.0f);

    info.Reset();
    EXPECT_EQ(info, Graphics::DrawInfo{});
}

TEST(SpriteVertex, InstanceDataCarriesRectTintAndMatrix)
{
    Graphics::DrawInfo info = Graphics::DrawInfo::WithRect({0.25f, 0.5f, 0.25f, 0.5f});
    info.Tint = Graphics::Color::Grey();
    info.Translate(1.0f, 2.0f, 3.0f);

    const Graphics::InstanceData instance = Graphics::ToInstanceData(info);
    EXPECT_EQ(instance.Source, (std::array<float, 4>{0.25f, 0.5f, 0.25f, 0.5f}));
    EXPECT_EQ(instance.Color, Graphics::Color::Grey().AsArray());
    EXPECT_EQ(instance.Transform, info.Pose.AsMatrix());
}

TEST(SpriteVertex, InputLayoutCoversQuadAndInstanceStreams)
{
    const auto input = Graphics::GetSpriteVertexInput();

    ASSERT_EQ(input.Bindings.size(), 2u);
    EXPECT_EQ(input.Bindings[0].binding, Graphics::kQuadBinding);
    EXPECT_EQ(input.Bindings[0].stride, sizeof(Graphics::QuadVertex));
    EXPECT_EQ(input.Bindings[1].binding, Graphics::kInstanceBinding);
    EXPECT_EQ(input.Bindings[1].stride, sizeof(Graphics::InstanceData));

    // 3 quad attributes + rect + tint + 4 matrix columns.
    ASSERT_EQ(input.Attributes.size(), 9u);
    for (uint32_t i = 0; i < input.Attributes.size(); ++i)
    {
        EXPECT_EQ(input.Attributes[i].location, i);
        EXPECT_EQ(input.Attributes[i].binding, i < 3 ? Graphics::kQuadBinding : Graphics::kInstanceBinding);
    }
    EXPECT_EQ(input.Attributes[8].offset + 4 * sizeof(float), sizeof(Graphics::InstanceData));
}

TEST(SpriteVertex, QuadIsUnitTriangleStrip)
{
    ASSERT_EQ(Graphics::kQuadVertices.size(), Graphics::kQuadVertexCount);
    for (const auto& v : Graphics::kQuadVertices)
    {
        EXPECT_EQ(v.Position[0], v.UV[0]);
        EXPECT_EQ(v.Position[1], v.UV[1]);
        EXPECT_EQ(v.Color, Graphics::Color::White().AsArray());
    }
}
