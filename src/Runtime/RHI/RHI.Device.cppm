module;
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Device;

import :Context;

export namespace RHI
{
    struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;

        [[nodiscard]] bool IsComplete() const { return GraphicsFamily.has_value(); }
    };

    // Logical device + graphics queue + VMA allocator.
    // Surface and swapchain selection belong to the host application.
    class VulkanDevice
    {
    public:
        explicit VulkanDevice(VulkanContext& context);
        ~VulkanDevice();

        // No copy
        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VkCommandPool GetCommandPool() const { return m_CommandPool; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        // Unique per process; never reused, unlike the device's address.
        [[nodiscard]] uint64_t GetUniqueId() const { return m_UniqueId; }
        [[nodiscard]] constexpr uint32_t GetFramesInFlight() const { return MAX_FRAMES_IN_FLIGHT; }

        [[nodiscard]] VkResult SubmitToGraphicsQueue(const VkSubmitInfo& submitInfo, VkFence fence);
        void WaitIdle();

        void RegisterThreadLocalPool(VkCommandPool pool);

        // Deferred destruction: work queued in frame N runs when frame N's slot is flushed again.
        void FlushDeletionQueue(uint32_t frameIndex);
        void SafeDestroy(std::function<void()>&& deleteFn);

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;
        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;

        VmaAllocator m_Allocator = VK_NULL_HANDLE;
        VkCommandPool m_CommandPool = VK_NULL_HANDLE;

        std::mutex m_QueueMutex;
        std::mutex m_ThreadPoolsMutex;
        std::vector<VkCommandPool> m_ThreadCommandPools;

        bool m_IsValid = true;
        uint64_t m_UniqueId = 0;
        static inline std::atomic<uint64_t> s_NextUniqueId{1};

        static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;
        std::vector<std::function<void()>> m_DeletionQueue[MAX_FRAMES_IN_FLIGHT];
        uint32_t m_CurrentFrameIndex = 0;
        std::mutex m_DeletionMutex;

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);
        void CreateCommandPool();

        [[nodiscard]] bool IsDeviceSuitable(VkPhysicalDevice device) const;
        [[nodiscard]] static QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device);
    };
}
