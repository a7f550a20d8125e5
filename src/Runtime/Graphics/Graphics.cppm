export module Graphics;

export import :DrawInfo;
export import :SpriteVertex;
export import :ShaderProgram;
export import :RenderContext;
export import :SpriteBatch;
export import :Renderer;
export import :SpritePipelineFactory;
export import :OffscreenRenderContext;
