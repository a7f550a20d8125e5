#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

import Core;
import RHI;
import Graphics;

using namespace Core;

namespace
{
    // 8x8 two-tone checker, tightly packed RGBA8.
    std::vector<uint8_t> MakeCheckerPixels(uint32_t size)
    {
        const auto light = Graphics::Color::White().AsU8Array();
        const auto dark = Graphics::Color::Grey().AsU8Array();

        std::vector<uint8_t> pixels;
        pixels.reserve(static_cast<size_t>(size) * size * 4);
        for (uint32_t y = 0; y < size; ++y)
        {
            for (uint32_t x = 0; x < size; ++x)
            {
                const auto& texel = ((x + y) % 2 == 0) ? light : dark;
                pixels.insert(pixels.end(), texel.begin(), texel.end());
            }
        }
        return pixels;
    }
}

int main(int argc, char** argv)
{
    const std::filesystem::path shaderDir = (argc > 1) ? std::filesystem::path(argv[1]) : std::filesystem::path("shaders");

    RHI::VulkanContext context({.AppName = "LedgeSandbox", .EnableValidation = true, .Headless = true});
    if (!context.IsValid())
    {
        Log::Error("Sandbox: no Vulkan instance available");
        return 1;
    }

    RHI::VulkanDevice device(context);
    if (!device.IsValid())
    {
        Log::Error("Sandbox: no suitable Vulkan 1.3 device");
        return 1;
    }

    // Scope all GPU objects so they are gone before the device.
    {
        RHI::ShaderModule vertexShader(device, (shaderDir / "sprite.vert.spv").string(), RHI::ShaderStage::Vertex);
        RHI::ShaderModule fragmentShader(device, (shaderDir / "sprite.frag.spv").string(), RHI::ShaderStage::Fragment);
        if (!vertexShader.IsValid() || !fragmentShader.IsValid())
        {
            Log::Error("Sandbox: sprite shaders missing in {}", shaderDir.string());
            return 1;
        }

        const Graphics::OffscreenTargetConfig targetConfig{.Width = 256, .Height = 256};
        Graphics::OffscreenRenderContext target(device, targetConfig);
        if (!target.IsValid()) return 1;

        auto factory = std::make_unique<Graphics::SpritePipelineFactory>(device, Graphics::SpritePipelineConfig{
            .VertexShader = &vertexShader,
            .FragmentShader = &fragmentShader,
            .Topology = RHI::VertexTopology::TriangleStrip,
            .ColorFormat = targetConfig.ColorFormat,
        });

        auto program = Graphics::ShaderProgram::Create(std::move(factory), RHI::BlendMode::Alpha);
        if (!program)
        {
            Log::Error("Sandbox: sprite program failed: {}", ErrorCodeToString(program.error()));
            return 1;
        }

        // Register every variant up front so switching modes mid-run never compiles.
        for (RHI::BlendMode mode : RHI::kAllBlendModes)
        {
            if (auto built = (*program)->BuildPipeline(mode); !built)
            {
                Log::Error("Sandbox: {} pipeline failed: {}", RHI::ToString(mode), ErrorCodeToString(built.error()));
                return 1;
            }
        }

        Graphics::Renderer renderer;
        const Graphics::ShaderId spriteShader = renderer.RegisterShader(std::move(*program));

        const std::vector<uint8_t> pixels = MakeCheckerPixels(8);
        auto texture = std::make_shared<const RHI::Texture>(device, pixels, 8u, 8u);

        Graphics::SpriteBatch batch(texture);
        const std::array<std::pair<float, float>, 4> corners = {{{0.5f, 0.5f}, {-0.5f, 0.5f}, {0.5f, -0.5f}, {-0.5f, -0.5f}}};
        for (const auto& [x, y] : corners)
        {
            Graphics::DrawInfo info;
            info.Scale(0.4f).Translate(x - 0.2f, y - 0.2f, 0.0f);
            batch.Insert(info);
        }

        for (RHI::BlendMode mode : RHI::kAllBlendModes)
        {
            renderer.GetShader(spriteShader)->SetCurrentMode(mode);

            if (auto begun = renderer.BeginFrame(target, Graphics::Color::Black()); !begun)
            {
                return 1;
            }

            auto drawn = renderer.Draw(target, batch);
            if (!drawn)
            {
                Log::Warn("Sandbox: frame with {} blending dropped its draws", RHI::ToString(mode));
            }

            if (auto presented = renderer.Present(target); !presented)
            {
                Log::Error("Sandbox: present failed: {}", ErrorCodeToString(presented.error()));
                return 1;
            }

            Log::Info("Sandbox: {} frame presented ({} instances)", RHI::ToString(mode), batch.Size());
        }

        auto texels = target.ReadbackColor();
        if (texels)
        {
            // Top-left quarter sits under the (-0.5, -0.5) sprite.
            const size_t index = (static_cast<size_t>(targetConfig.Height / 4) * targetConfig.Width + targetConfig.Width / 4) * 4;
            Log::Info("Sandbox: texel at quarter point = ({}, {}, {}, {})",
                      (*texels)[index], (*texels)[index + 1], (*texels)[index + 2], (*texels)[index + 3]);
        }
    }

    device.WaitIdle();
    return 0;
}
