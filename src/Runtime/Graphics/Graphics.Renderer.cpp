module;
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

module Graphics:Renderer.Impl;

import RHI;
import Core;
import :Renderer;
import :DrawInfo;
import :ShaderProgram;
import :RenderContext;

namespace Graphics
{
    namespace
    {
        // Sets `aborted` on scope exit unless Dismiss() ran, so a throwing drawable aborts the frame too.
        class FrameAbortGuard
        {
        public:
            FrameAbortGuard(bool& aborted, bool armed) : m_Aborted(aborted), m_Armed(armed) {}
            ~FrameAbortGuard()
            {
                if (m_Armed) m_Aborted = true;
            }

            FrameAbortGuard(const FrameAbortGuard&) = delete;
            FrameAbortGuard& operator=(const FrameAbortGuard&) = delete;

            void Dismiss() { m_Armed = false; }

        private:
            bool& m_Aborted;
            bool m_Armed;
        };
    }

    Renderer::Renderer(RendererConfig config)
        : m_Config(config), m_CurrentShader(config.DefaultShader)
    {
    }

    ShaderId Renderer::RegisterShader(std::shared_ptr<ShaderProgram> program)
    {
        const auto id = static_cast<ShaderId>(m_Shaders.size());
        m_Shaders.push_back(std::move(program));
        return id;
    }

    ShaderProgram* Renderer::GetShader(ShaderId id) const
    {
        return id < m_Shaders.size() ? m_Shaders[id].get() : nullptr;
    }

    Core::Result Renderer::SetCurrentShader(ShaderId id)
    {
        if (!GetShader(id))
        {
            Core::Log::Error("Renderer: shader {} is not registered ({} shaders)", id, m_Shaders.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }
        m_CurrentShader = id;
        return Core::Ok();
    }

    Core::Result Renderer::BeginFrame(IRenderContext& context, const Color& clearColor)
    {
        if (m_FrameActive)
        {
            Core::Log::Error("Renderer: BeginFrame called twice without Present");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        if (auto begun = context.BeginFrame(clearColor); !begun)
        {
            Core::Log::Error("Renderer: context failed to begin frame: {}", Core::ErrorCodeToString(begun.error()));
            return begun;
        }

        m_FrameActive = true;
        m_FrameAborted = false;
        m_FrameDrawCount = 0;
        return Core::Ok();
    }

    Core::Result Renderer::Draw(IRenderContext& context, const IDrawable& drawable, const DrawInfo& info)
    {
        if (!m_FrameActive)
        {
            Core::Log::Error("Renderer: Draw outside of BeginFrame/Present");
            return Core::Err(Core::ErrorCode::FrameNotStarted);
        }
        if (m_FrameAborted)
        {
            return Core::Err(Core::ErrorCode::FrameAborted);
        }

        ShaderProgram* shader = GetShader(m_CurrentShader);
        if (!shader)
        {
            Core::Log::Error("Renderer: current shader {} is not registered", m_CurrentShader);
            if (m_Config.AbortFrameOnError) m_FrameAborted = true;
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        FrameAbortGuard abortGuard(m_FrameAborted, m_Config.AbortFrameOnError);
        DrawContext drawContext{context.GetCommandStream(), *shader};
        auto drawn = drawable.Draw(drawContext, info);
        if (!drawn)
        {
            Core::Log::Error("Renderer: draw with shader {} ({}) failed: {}{}",
                             m_CurrentShader, RHI::ToString(shader->GetCurrentMode()),
                             Core::ErrorCodeToString(drawn.error()),
                             m_Config.AbortFrameOnError ? ", aborting remaining draws of this frame" : "");
            return drawn;
        }

        abortGuard.Dismiss();
        ++m_FrameDrawCount;
        return Core::Ok();
    }

    Core::Result Renderer::DrawWith(IRenderContext& context, const IDrawable& drawable,
                                    const DrawInfo& info, ShaderId shader)
    {
        if (!GetShader(shader))
        {
            Core::Log::Error("Renderer: DrawWith unknown shader {}", shader);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        ScopedShaderOverride guard(m_CurrentShader, shader);
        return Draw(context, drawable, info);
    }

    Core::Result Renderer::Present(IRenderContext& context)
    {
        if (!m_FrameActive)
        {
            Core::Log::Error("Renderer: Present without BeginFrame");
            return Core::Err(Core::ErrorCode::FrameNotStarted);
        }

        m_FrameActive = false;
        m_FrameAborted = false;
        return context.Present();
    }
}
