#pragma once

#include "core/Base.hpp"
#include "rhi/Device.hpp"
#include <volk.h>

namespace DotObjViewer
{
    struct RHIConfig
    {
        bool_t enableValidation = false;
        bool_t headless         = false; // No surface extensions, no swapchain
    };

    /**
     * @brief Process-wide Vulkan instance and adapter list.
     * Devices created from here are owned by the caller.
     */
    class RHI
    {
    public:
        static Result Init( RHIConfig config );
        static void   Shutdown();

        /**
         * @brief Creates a logical device on the given adapter.
         * @return nullptr if the adapter index is invalid or device creation fails.
         */
        static Ref<Device> CreateDevice( uint32_t adapterIndex );
        static void        DestroyDevice( Ref<Device> device );

        static bool_t     IsInitialized() { return s_initialized; }
        static VkInstance GetInstance() { return s_instance; }
        static uint32_t   GetAdapterCount() { return static_cast<uint32_t>( s_physicalDevices.size() ); }
        static bool_t     IsHeadless() { return s_config.headless; }

    private:
        static Result CreateInstance( bool_t enableValidation, bool_t headless );
        static void   SetupDebugMessenger();
        static void   EnumeratePhysicalDevices();

    private:
        static VkInstance                    s_instance;
        static VkDebugUtilsMessengerEXT      s_debugMessenger;
        static std::vector<VkPhysicalDevice> s_physicalDevices;
        static bool_t                        s_initialized;
        static RHIConfig                     s_config;
    };
} // namespace DotObjViewer
