module;
#include <memory>

export module Graphics:RenderContext;

import RHI;
import Core;
import :DrawInfo;
import :ShaderProgram;

export namespace Graphics
{
    // Frame boundary collaborator. Owns the command buffer and the target it renders into.
    class IRenderContext
    {
    public:
        virtual ~IRenderContext() = default;

        // Starts recording and clears the target to `clearColor`.
        [[nodiscard]] virtual Core::Result BeginFrame(const Color& clearColor) = 0;

        // Only meaningful between a successful BeginFrame() and Present().
        [[nodiscard]] virtual RHI::ICommandStream& GetCommandStream() = 0;

        // Ends recording and submits. Must be callable even if draws of the frame failed.
        [[nodiscard]] virtual Core::Result Present() = 0;
    };

    // What a drawable sees while recording: where to record and which program to record with.
    struct DrawContext
    {
        RHI::ICommandStream& Stream;
        const ShaderProgram& Shader;
    };

    class IDrawable
    {
    public:
        virtual ~IDrawable() = default;

        // `info` applies to the drawable as a whole (see SpriteBatch::Flatten).
        [[nodiscard]] virtual Core::Result Draw(DrawContext& context, const DrawInfo& info) const = 0;
    };
}
