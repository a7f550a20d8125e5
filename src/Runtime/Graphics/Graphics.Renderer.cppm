module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

export module Graphics:Renderer;

import Core;
import :DrawInfo;
import :ShaderProgram;
import :RenderContext;

export namespace Graphics
{
    using ShaderId = uint32_t;

    struct RendererConfig
    {
        // Program used by Draw() until SetCurrentShader() says otherwise.
        ShaderId DefaultShader = 0;
        // A failed draw makes every later draw of the frame fail with FrameAborted.
        bool AbortFrameOnError = true;
    };

    // Swaps `slot` to `shader` for the guard's lifetime; restores on every exit path.
    class ScopedShaderOverride
    {
    public:
        ScopedShaderOverride(ShaderId& slot, ShaderId shader)
            : m_Slot(slot), m_Previous(slot)
        {
            m_Slot = shader;
        }

        ~ScopedShaderOverride() { m_Slot = m_Previous; }

        ScopedShaderOverride(const ScopedShaderOverride&) = delete;
        ScopedShaderOverride& operator=(const ScopedShaderOverride&) = delete;

    private:
        ShaderId& m_Slot;
        ShaderId m_Previous;
    };

    // Frame protocol: BeginFrame -> Draw / DrawWith (any number) -> Present.
    // Each draw resolves its pipeline from the shader and blend mode current at call time.
    // Single-threaded.
    class Renderer
    {
    public:
        explicit Renderer(RendererConfig config = {});

        [[nodiscard]] ShaderId RegisterShader(std::shared_ptr<ShaderProgram> program);
        // nullptr for unknown ids.
        [[nodiscard]] ShaderProgram* GetShader(ShaderId id) const;
        [[nodiscard]] size_t GetShaderCount() const { return m_Shaders.size(); }

        [[nodiscard]] Core::Result SetCurrentShader(ShaderId id);
        [[nodiscard]] ShaderId GetCurrentShader() const { return m_CurrentShader; }

        [[nodiscard]] Core::Result BeginFrame(IRenderContext& context, const Color& clearColor);
        [[nodiscard]] Core::Result Draw(IRenderContext& context, const IDrawable& drawable, const DrawInfo& info = {});
        [[nodiscard]] Core::Result DrawWith(IRenderContext& context, const IDrawable& drawable,
                                            const DrawInfo& info, ShaderId shader);
        // Callable after an aborted frame; always ends the frame.
        [[nodiscard]] Core::Result Present(IRenderContext& context);

        [[nodiscard]] bool IsFrameActive() const { return m_FrameActive; }
        [[nodiscard]] bool IsFrameAborted() const { return m_FrameAborted; }
        // Successful draws since the last BeginFrame().
        [[nodiscard]] uint32_t GetFrameDrawCount() const { return m_FrameDrawCount; }

    private:
        RendererConfig m_Config;
        std::vector<std::shared_ptr<ShaderProgram>> m_Shaders;
        ShaderId m_CurrentShader = 0;

        bool m_FrameActive = false;
        bool m_FrameAborted = false;
        uint32_t m_FrameDrawCount = 0;
    };
}
