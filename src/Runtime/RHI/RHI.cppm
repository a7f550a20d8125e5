export module RHI;

export import :Buffer;
export import :CommandStream;
export import :CommandUtils;
export import :Context;
export import :Descriptors;
export import :Device;
export import :Image;
export import :Pipeline;
export import :Shader;
export import :Texture;
export import :TransientAllocator;
export import :Types;
export import :VulkanCommandStream;
