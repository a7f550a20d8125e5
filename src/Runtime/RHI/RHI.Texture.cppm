module;
#include <cstdint>
#include <memory>
#include <span>
#include "RHI.Vulkan.hpp"

export module RHI:Texture;

import :Device;
import :Image;

export namespace RHI
{
    // Immutable sampled image (view + sampler) shared by every batch that draws it.
    class Texture
    {
    public:
        // View/sampler pair owned by someone else (the resource provider).
        // The Texture never destroys adopted handles.
        struct ExternalBinding
        {
            VkImageView View = VK_NULL_HANDLE;
            VkSampler Sampler = VK_NULL_HANDLE;
            uint32_t Width = 0;
            uint32_t Height = 0;
        };

        // Uploads an already-decoded, tightly packed RGBA8 buffer (width * height * 4 bytes).
        Texture(VulkanDevice& device, std::span<const uint8_t> rgbaPixels, uint32_t width, uint32_t height);
        explicit Texture(const ExternalBinding& external);
        ~Texture();

        Texture(const Texture&) = delete;
        Texture& operator=(const Texture&) = delete;

        [[nodiscard]] VkImageView GetView() const { return m_View; }
        [[nodiscard]] VkSampler GetSampler() const { return m_Sampler; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Width; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Height; }

        [[nodiscard]] bool IsValid() const { return m_View != VK_NULL_HANDLE && m_Sampler != VK_NULL_HANDLE; }

    private:
        VulkanDevice* m_Device = nullptr; // nullptr for adopted bindings
        std::unique_ptr<VulkanImage> m_Image;
        VkImageView m_View = VK_NULL_HANDLE;
        VkSampler m_Sampler = VK_NULL_HANDLE;
        uint32_t m_Width = 0;
        uint32_t m_Height = 0;

        void CreateSampler();
        void Upload(std::span<const uint8_t> rgbaPixels);
    };
}
