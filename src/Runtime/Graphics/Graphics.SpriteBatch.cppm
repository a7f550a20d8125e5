module;
#include <cstddef>
#include <memory>
#include <span>
#include <vector>

export module Graphics:SpriteBatch;

import RHI;
import Core;
import :DrawInfo;
import :SpriteVertex;
import :RenderContext;

export namespace Graphics
{
    // Geometry for one instanced draw. Vertices always views kQuadVertices.
    struct FlattenedBatch
    {
        std::span<const QuadVertex> Vertices;
        std::vector<InstanceData> Instances;
    };

    // Many instances of one texture, drawn with a single instanced draw in insertion order.
    // Never cleared implicitly. Not thread-safe: serialize Insert/Clear against Draw.
    class SpriteBatch final : public IDrawable
    {
    public:
        explicit SpriteBatch(std::shared_ptr<const RHI::Texture> texture);

        void Insert(const DrawInfo& info) { m_Infos.push_back(info); }
        void Clear() { m_Infos.clear(); }
        void Reserve(size_t count) { m_Infos.reserve(count); }

        [[nodiscard]] size_t Size() const { return m_Infos.size(); }
        [[nodiscard]] bool Empty() const { return m_Infos.empty(); }
        [[nodiscard]] const std::vector<DrawInfo>& GetDrawInfos() const { return m_Infos; }
        [[nodiscard]] const std::shared_ptr<const RHI::Texture>& GetTexture() const { return m_Texture; }

        // One InstanceData per inserted DrawInfo, in insertion order. Pure: same state, same bytes.
        [[nodiscard]] FlattenedBatch Flatten() const;

        // As Flatten(), then batchInfo's matrix is left-multiplied onto every instance transform and
        // its tint multiplied into every instance color. batchInfo's rect is ignored.
        // A default batchInfo yields exactly Flatten().
        [[nodiscard]] FlattenedBatch Flatten(const DrawInfo& batchInfo) const;

        // InvalidResource if the texture is missing or not ready.
        [[nodiscard]] Core::Result Draw(DrawContext& context, const DrawInfo& info) const override;

    private:
        std::shared_ptr<const RHI::Texture> m_Texture;
        std::vector<DrawInfo> m_Infos;
    };
}
