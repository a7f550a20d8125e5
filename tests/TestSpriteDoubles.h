#pragma once

// =============================================================================
// Device-free doubles for the sprite draw path.
//
// Usage: #include "TestSpriteDoubles.h" AFTER `import RHI; import Core;
// import Graphics;` in each test file. Everything is inline to avoid ODR
// issues across translation units.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "RHI.Vulkan.hpp"

// Fabricated non-dispatchable handle. Never handed to the driver.
// Non-dispatchable handles are opaque pointers on 64-bit targets and uint64_t on 32-bit ones.
template <typename Handle>
inline Handle FakeHandle(uint64_t value)
{
    if constexpr (std::is_pointer_v<Handle>)
        return reinterpret_cast<Handle>(static_cast<uintptr_t>(value));
    else
        return static_cast<Handle>(value);
}

// Pipeline that owns nothing; distinct `id` values give distinct handles.
inline std::shared_ptr<const RHI::GraphicsPipeline> MakeFakePipeline(uint64_t id)
{
    return std::make_shared<const RHI::GraphicsPipeline>(
        nullptr,
        FakeHandle<VkPipeline>(0x1000 + id),
        FakeHandle<VkPipelineLayout>(0x2000 + id),
        std::vector<VkDescriptorSetLayout>{FakeHandle<VkDescriptorSetLayout>(0x3000 + id),
                                           FakeHandle<VkDescriptorSetLayout>(0x4000 + id)});
}

inline std::shared_ptr<const RHI::Texture> MakeFakeTexture()
{
    return std::make_shared<const RHI::Texture>(RHI::Texture::ExternalBinding{
        .View = FakeHandle<VkImageView>(0x5000),
        .Sampler = FakeHandle<VkSampler>(0x6000),
        .Width = 8,
        .Height = 8,
    });
}

// Records every call in order. BindDescriptors / BindVertexStreams can be told to fail.
class RecordingCommandStream final : public RHI::ICommandStream
{
public:
    struct DescriptorBind
    {
        VkPipelineLayout Layout = VK_NULL_HANDLE;
        uint32_t SetIndex = 0;
        std::vector<RHI::DescriptorWrite> Writes;
    };

    struct StreamBind
    {
        uint32_t FirstBinding = 0;
        std::vector<std::vector<std::byte>> Streams;
    };

    struct DrawCall
    {
        uint32_t VertexCount = 0;
        uint32_t InstanceCount = 0;
        uint32_t FirstVertex = 0;
        uint32_t FirstInstance = 0;
    };

    void BindPipeline(const RHI::GraphicsPipeline& pipeline) override
    {
        Calls.push_back("BindPipeline");
        BoundPipelines.push_back(pipeline.GetHandle());
    }

    Core::Result BindDescriptors(const RHI::GraphicsPipeline& pipeline,
                                 uint32_t setIndex,
                                 std::span<const RHI::DescriptorWrite> writes) override
    {
        Calls.push_back("BindDescriptors");
        if (FailDescriptors) return Core::Err(*FailDescriptors);

        DescriptorBinds.push_back({pipeline.GetLayout(), setIndex,
                                   std::vector<RHI::DescriptorWrite>(writes.begin(), writes.end())});
        return Core::Ok();
    }

    Core::Result BindVertexStreams(uint32_t firstBinding,
                                   std::span<const std::span<const std::byte>> streams) override
    {
        Calls.push_back("BindVertexStreams");
        if (FailStreams) return Core::Err(*FailStreams);

        StreamBind bind{.FirstBinding = firstBinding};
        for (std::span<const std::byte> s : streams)
        {
            bind.Streams.emplace_back(s.begin(), s.end());
        }
        StreamBinds.push_back(std::move(bind));
        return Core::Ok();
    }

    void Draw(uint32_t vertexCount, uint32_t instanceCount, uint32_t firstVertex, uint32_t firstInstance) override
    {
        Calls.push_back("Draw");
        Draws.push_back({vertexCount, instanceCount, firstVertex, firstInstance});
    }

    std::optional<Core::ErrorCode> FailDescriptors;
    std::optional<Core::ErrorCode> FailStreams;

    std::vector<std::string> Calls;
    std::vector<VkPipeline> BoundPipelines;
    std::vector<DescriptorBind> DescriptorBinds;
    std::vector<StreamBind> StreamBinds;
    std::vector<DrawCall> Draws;
};

// Frame boundaries without a device. Counts begin/present and can fail either.
class FakeRenderContext final : public Graphics::IRenderContext
{
public:
    Core::Result BeginFrame(const Graphics::Color& clearColor) override
    {
        ++BeginCount;
        LastClear = clearColor;
        if (FailBegin) return Core::Err(*FailBegin);
        Stream = RecordingCommandStream{};
        return Core::Ok();
    }

    RHI::ICommandStream& GetCommandStream() override { return Stream; }

    Core::Result Present() override
    {
        ++PresentCount;
        if (FailPresent) return Core::Err(*FailPresent);
        return Core::Ok();
    }

    std::optional<Core::ErrorCode> FailBegin;
    std::optional<Core::ErrorCode> FailPresent;

    RecordingCommandStream Stream;
    Graphics::Color LastClear{};
    int BeginCount = 0;
    int PresentCount = 0;
};

// Hands out fake pipelines and counts how often each mode was compiled.
class CountingPipelineFactory final : public Graphics::IPipelineFactory
{
public:
    explicit CountingPipelineFactory(int* buildCount, std::optional<Core::ErrorCode> failWith = std::nullopt)
        : m_BuildCount(buildCount), m_FailWith(failWith)
    {
    }

    Core::Expected<Graphics::PipelinePtr> Build(RHI::BlendMode mode) override
    {
        if (m_BuildCount) ++*m_BuildCount;
        if (m_FailWith) return std::unexpected(*m_FailWith);
        return MakeFakePipeline(RHI::ToIndex(mode));
    }

private:
    int* m_BuildCount = nullptr;
    std::optional<Core::ErrorCode> m_FailWith;
};

// Reinterprets one recorded instance stream.
inline std::vector<Graphics::InstanceData> DecodeInstances(const std::vector<std::byte>& bytes)
{
    std::vector<Graphics::InstanceData> instances(bytes.size() / sizeof(Graphics::InstanceData));
    if (!instances.empty())
    {
        std::memcpy(instances.data(), bytes.data(), instances.size() * sizeof(Graphics::InstanceData));
    }
    return instances;
}
