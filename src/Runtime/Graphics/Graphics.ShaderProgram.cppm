module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

export module Graphics:ShaderProgram;

import RHI;
import Core;

export namespace Graphics
{
    using PipelinePtr = std::shared_ptr<const RHI::GraphicsPipeline>;

    // Descriptor set index reserved for per-draw resources (texture, extra buffers).
    // Set 0 is left to frame-global data.
    inline constexpr uint32_t kResourceSetIndex = 1;

    // Everything one instanced draw needs. Spans are borrowed for the duration of ShaderProgram::Draw.
    struct DrawPayload
    {
        std::span<const std::byte> Vertices;
        uint32_t VertexCount = 0;
        std::span<const std::byte> Instances;
        uint32_t InstanceCount = 0;
        std::vector<RHI::DescriptorWrite> Descriptors;

        DrawPayload& Buffer(uint32_t binding, VkBuffer buffer,
                            RHI::DescriptorWrite::Kind kind = RHI::DescriptorWrite::Kind::UniformBuffer,
                            VkDeviceSize offset = 0, VkDeviceSize range = VK_WHOLE_SIZE);
        DrawPayload& SampledImage(uint32_t binding, VkImageView view, VkSampler sampler);
    };

    // Blend mode -> compiled pipeline. A slot, once filled, is never replaced.
    // No internal locking: mutate from one thread only.
    class PipelineObjectSet
    {
    public:
        // Returns false (and keeps the existing binding) if the mode is already bound or pipeline is null.
        [[nodiscard]] bool Insert(RHI::BlendMode mode, PipelinePtr pipeline);

        // nullptr on miss ("not built yet").
        [[nodiscard]] PipelinePtr Get(RHI::BlendMode mode) const { return m_Pipelines[RHI::ToIndex(mode)]; }
        [[nodiscard]] bool Contains(RHI::BlendMode mode) const { return m_Pipelines[RHI::ToIndex(mode)] != nullptr; }
        [[nodiscard]] size_t Size() const;

    private:
        std::array<PipelinePtr, RHI::kBlendModeCount> m_Pipelines{};
    };

    // Compiles the pipeline variant of one shader pair for a given blend mode.
    class IPipelineFactory
    {
    public:
        virtual ~IPipelineFactory() = default;
        [[nodiscard]] virtual Core::Expected<PipelinePtr> Build(RHI::BlendMode mode) = 0;
    };

    // One shader pair, compiled lazily into at most one pipeline per blend mode.
    class ShaderProgram
    {
    public:
        // Builds nothing; call BuildPipeline() or Insert() before drawing with a mode.
        explicit ShaderProgram(std::unique_ptr<IPipelineFactory> factory,
                               RHI::BlendMode initialMode = RHI::BlendMode::Alpha);

        ShaderProgram(const ShaderProgram&) = delete;
        ShaderProgram& operator=(const ShaderProgram&) = delete;

        // Builds and registers the pipeline for initialMode up front.
        [[nodiscard]] static Core::Expected<std::unique_ptr<ShaderProgram>> Create(
            std::unique_ptr<IPipelineFactory> factory, RHI::BlendMode initialMode);

        // Wraps an already compiled pipeline. The result has no factory, so other modes can only be Insert()ed.
        [[nodiscard]] static std::unique_ptr<ShaderProgram> FromPipeline(RHI::BlendMode mode, PipelinePtr pipeline);

        // Switches state only, never builds.
        void SetCurrentMode(RHI::BlendMode mode) { m_CurrentMode = mode; }
        [[nodiscard]] RHI::BlendMode GetCurrentMode() const { return m_CurrentMode; }

        // Ok if already built. Otherwise builds through the factory and registers the result.
        [[nodiscard]] Core::Result BuildPipeline(RHI::BlendMode mode);
        [[nodiscard]] bool Insert(RHI::BlendMode mode, PipelinePtr pipeline);
        [[nodiscard]] bool HasPipeline(RHI::BlendMode mode) const { return m_Pipelines.Contains(mode); }

        // PipelineNotRegistered if the current mode was never built/inserted.
        [[nodiscard]] Core::Expected<PipelinePtr> ResolvePipeline() const;
        [[nodiscard]] Core::Expected<VkPipelineLayout> ResolveLayout() const;

        [[nodiscard]] const PipelineObjectSet& GetPipelines() const { return m_Pipelines; }

        // Bind pipeline -> bind resource set (kResourceSetIndex) -> bind quad + instance streams -> one draw.
        // Zero instances: state is bound but no draw is recorded.
        [[nodiscard]] Core::Result Draw(RHI::ICommandStream& stream, const DrawPayload& payload) const;

    private:
        // Declared before the pipelines: pipelines may borrow layouts the factory owns.
        std::unique_ptr<IPipelineFactory> m_Factory;
        PipelineObjectSet m_Pipelines;
        RHI::BlendMode m_CurrentMode;
    };
}
