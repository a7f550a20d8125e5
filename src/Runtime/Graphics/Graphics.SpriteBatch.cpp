module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Graphics:SpriteBatch.Impl;

import RHI;
import Core;
import :SpriteBatch;
import :DrawInfo;
import :SpriteVertex;
import :ShaderProgram;
import :RenderContext;

namespace Graphics
{
    SpriteBatch::SpriteBatch(std::shared_ptr<const RHI::Texture> texture)
        : m_Texture(std::move(texture))
    {
    }

    FlattenedBatch SpriteBatch::Flatten() const
    {
        FlattenedBatch batch;
        batch.Vertices = kQuadVertices;
        batch.Instances.reserve(m_Infos.size());
        for (const DrawInfo& info : m_Infos)
        {
            batch.Instances.push_back(ToInstanceData(info));
        }
        return batch;
    }

    FlattenedBatch SpriteBatch::Flatten(const DrawInfo& batchInfo) const
    {
        FlattenedBatch batch = Flatten();

        const bool identityPose = batchInfo.Pose == Transform::Identity();
        const bool whiteTint = batchInfo.Tint == Color::White();
        if (identityPose && whiteTint)
        {
            return batch;
        }

        const glm::mat4 batchMatrix = batchInfo.Pose.AsMatrix();
        const auto tint = batchInfo.Tint.AsArray();
        for (InstanceData& instance : batch.Instances)
        {
            if (!identityPose)
            {
                instance.Transform = batchMatrix * instance.Transform;
            }
            if (!whiteTint)
            {
                for (size_t i = 0; i < tint.size(); ++i) instance.Color[i] *= tint[i];
            }
        }
        return batch;
    }

    Core::Result SpriteBatch::Draw(DrawContext& context, const DrawInfo& info) const
    {
        if (!m_Texture || !m_Texture->IsValid())
        {
            Core::Log::Error("SpriteBatch: cannot draw {} instances, texture is {}",
                             m_Infos.size(), m_Texture ? "not ready" : "missing");
            return Core::Err(Core::ErrorCode::InvalidResource);
        }

        const FlattenedBatch batch = Flatten(info);

        DrawPayload payload;
        payload.Vertices = std::as_bytes(batch.Vertices);
        payload.VertexCount = static_cast<uint32_t>(batch.Vertices.size());
        payload.Instances = std::as_bytes(std::span<const InstanceData>(batch.Instances));
        payload.InstanceCount = static_cast<uint32_t>(batch.Instances.size());
        payload.SampledImage(0, m_Texture->GetView(), m_Texture->GetSampler());

        return context.Shader.Draw(context.Stream, payload);
    }
}
