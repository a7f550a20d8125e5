module;
#include "RHI.Vulkan.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <utility>

module Graphics:ShaderProgram.Impl;

import RHI;
import Core;
import :ShaderProgram;

namespace Graphics
{
    // --- DrawPayload ---
    DrawPayload& DrawPayload::Buffer(uint32_t binding, VkBuffer buffer, RHI::DescriptorWrite::Kind kind,
                                     VkDeviceSize offset, VkDeviceSize range)
    {
        RHI::DescriptorWrite write{};
        write.Binding = binding;
        write.Type = kind;
        write.Buffer = buffer;
        write.Offset = offset;
        write.Range = range;
        Descriptors.push_back(write);
        return *this;
    }

    DrawPayload& DrawPayload::SampledImage(uint32_t binding, VkImageView view, VkSampler sampler)
    {
        RHI::DescriptorWrite write{};
        write.Binding = binding;
        write.Type = RHI::DescriptorWrite::Kind::CombinedImageSampler;
        write.View = view;
        write.Sampler = sampler;
        Descriptors.push_back(write);
        return *this;
    }

    // --- PipelineObjectSet ---
    bool PipelineObjectSet::Insert(RHI::BlendMode mode, PipelinePtr pipeline)
    {
        if (!pipeline)
        {
            Core::Log::Warn("PipelineObjectSet: refusing to bind a null pipeline to {}", RHI::ToString(mode));
            return false;
        }

        auto& slot = m_Pipelines[RHI::ToIndex(mode)];
        if (slot)
        {
            Core::Log::Warn("PipelineObjectSet: {} already has a pipeline; keeping the existing one",
                            RHI::ToString(mode));
            return false;
        }

        slot = std::move(pipeline);
        return true;
    }

    size_t PipelineObjectSet::Size() const
    {
        return static_cast<size_t>(std::count_if(m_Pipelines.begin(), m_Pipelines.end(),
                                                 [](const PipelinePtr& p) { return p != nullptr; }));
    }

    // --- ShaderProgram ---
    ShaderProgram::ShaderProgram(std::unique_ptr<IPipelineFactory> factory, RHI::BlendMode initialMode)
        : m_Factory(std::move(factory)), m_CurrentMode(initialMode)
    {
    }

    Core::Expected<std::unique_ptr<ShaderProgram>> ShaderProgram::Create(std::unique_ptr<IPipelineFactory> factory,
                                                                         RHI::BlendMode initialMode)
    {
        auto program = std::make_unique<ShaderProgram>(std::move(factory), initialMode);
        if (auto built = program->BuildPipeline(initialMode); !built)
        {
            return std::unexpected(built.error());
        }
        return program;
    }

    std::unique_ptr<ShaderProgram> ShaderProgram::FromPipeline(RHI::BlendMode mode, PipelinePtr pipeline)
    {
        auto program = std::make_unique<ShaderProgram>(nullptr, mode);
        (void)program->Insert(mode, std::move(pipeline));
        return program;
    }

    Core::Result ShaderProgram::BuildPipeline(RHI::BlendMode mode)
    {
        if (m_Pipelines.Contains(mode))
        {
            return Core::Ok();
        }

        if (!m_Factory)
        {
            Core::Log::Error("ShaderProgram: cannot build {} pipeline, program has no pipeline factory",
                             RHI::ToString(mode));
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        auto pipeline = m_Factory->Build(mode);
        if (!pipeline)
        {
            Core::Log::Error("ShaderProgram: building {} pipeline failed: {}",
                             RHI::ToString(mode), Core::ErrorCodeToString(pipeline.error()));
            return Core::Err(pipeline.error());
        }

        if (!m_Pipelines.Insert(mode, std::move(*pipeline)))
        {
            return Core::Err(Core::ErrorCode::PipelineCreationFailed);
        }

        Core::Log::Debug("ShaderProgram: built {} pipeline", RHI::ToString(mode));
        return Core::Ok();
    }

    bool ShaderProgram::Insert(RHI::BlendMode mode, PipelinePtr pipeline)
    {
        return m_Pipelines.Insert(mode, std::move(pipeline));
    }

    Core::Expected<PipelinePtr> ShaderProgram::ResolvePipeline() const
    {
        PipelinePtr pipeline = m_Pipelines.Get(m_CurrentMode);
        if (!pipeline)
        {
            Core::Log::Error("ShaderProgram: blend mode {} selected but no pipeline was registered for it",
                             RHI::ToString(m_CurrentMode));
            return std::unexpected(Core::ErrorCode::PipelineNotRegistered);
        }
        return pipeline;
    }

    Core::Expected<VkPipelineLayout> ShaderProgram::ResolveLayout() const
    {
        return ResolvePipeline().transform([](const PipelinePtr& pipeline) { return pipeline->GetLayout(); });
    }

    Core::Result ShaderProgram::Draw(RHI::ICommandStream& stream, const DrawPayload& payload) const
    {
        auto pipeline = ResolvePipeline();
        if (!pipeline)
        {
            return Core::Err(pipeline.error());
        }

        const RHI::GraphicsPipeline& gp = **pipeline;
        stream.BindPipeline(gp);

        if (!payload.Descriptors.empty())
        {
            if (auto bound = stream.BindDescriptors(gp, kResourceSetIndex, payload.Descriptors); !bound)
            {
                return bound;
            }
        }

        if (payload.InstanceCount == 0)
        {
            return Core::Ok();
        }

        const std::array<std::span<const std::byte>, 2> streams = {payload.Vertices, payload.Instances};
        if (auto bound = stream.BindVertexStreams(0, streams); !bound)
        {
            return bound;
        }

        stream.Draw(payload.VertexCount, payload.InstanceCount, 0, 0);
        return Core::Ok();
    }
}
