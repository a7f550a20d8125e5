#pragma once

// Every translation unit goes through volk; nobody links the Vulkan loader directly.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

#include <volk.h>
#include <cstdio>

// VMA declarations only. VMA_IMPLEMENTATION lives in RHI.Vma.cpp.
#include <vk_mem_alloc.h>

// Wraps Vulkan calls whose failure is logged but not propagated.
#ifndef NDEBUG
    #define VK_CHECK(x)                                                              \
        do {                                                                         \
            VkResult result = x;                                                     \
            if (result != VK_SUCCESS) {                                              \
                std::fprintf(stderr, "Vulkan Error: %s failed with result %d at %s:%d\n", \
                       #x, static_cast<int>(result), __FILE__, __LINE__);            \
            }                                                                        \
        } while(0)
#else
    #define VK_CHECK(x) (void)(x)
#endif
