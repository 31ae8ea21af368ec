#include "rhi/RHI.hpp"

#include <GLFW/glfw3.h>

namespace DotObjViewer
{

    VkInstance                    RHI::s_instance        = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT      RHI::s_debugMessenger  = VK_NULL_HANDLE;
    std::vector<VkPhysicalDevice> RHI::s_physicalDevices = {};
    bool_t                        RHI::s_initialized     = false;
    RHIConfig                     RHI::s_config          = {};

    VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback( VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity, VkDebugUtilsMessageTypeFlagsEXT messageType,
                                                  const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData, void* pUserData );

    Result RHI::Init( RHIConfig config )
    {
        if( s_initialized )
        {
            DOV_CORE_WARN( "RHI already initialized!" );
            return Result::SUCCESS;
        }

        if( volkInitialize() != VK_SUCCESS )
        {
            DOV_CORE_CRITICAL( "Failed to initialize volk! Is a Vulkan loader installed?" );
            return Result::FAIL;
        }

        s_config = config;
        if( CreateInstance( s_config.enableValidation, s_config.headless ) != Result::SUCCESS )
        {
            DOV_CORE_CRITICAL( "Failed to create Vulkan instance!" );
            volkFinalize();
            return Result::FAIL;
        }
        volkLoadInstance( s_instance );

        if( s_config.enableValidation )
        {
            SetupDebugMessenger();
        }

        EnumeratePhysicalDevices();

        DOV_CORE_INFO( "Vulkan RHI initialized with {} physical device(s).", s_physicalDevices.size() );
        s_initialized = true;
        return Result::SUCCESS;
    }

    void RHI::Shutdown()
    {
        if( !s_initialized )
        {
            return;
        }

        if( s_debugMessenger != VK_NULL_HANDLE )
        {
            auto func = ( PFN_vkDestroyDebugUtilsMessengerEXT )vkGetInstanceProcAddr( s_instance, "vkDestroyDebugUtilsMessengerEXT" );
            if( func != nullptr )
            {
                func( s_instance, s_debugMessenger, nullptr );
            }
            s_debugMessenger = VK_NULL_HANDLE;
        }
        s_physicalDevices.clear();

        if( s_instance != VK_NULL_HANDLE )
        {
            vkDestroyInstance( s_instance, nullptr );
            s_instance = VK_NULL_HANDLE;
        }
        volkFinalize();
        s_initialized = false;
        DOV_CORE_INFO( "Vulkan RHI shutdown complete." );
    }

    Ref<Device> RHI::CreateDevice( uint32_t adapterIndex )
    {
        if( !s_initialized )
        {
            DOV_CORE_CRITICAL( "RHI not initialized! Cannot create device." );
            return nullptr;
        }

        if( adapterIndex >= s_physicalDevices.size() )
        {
            DOV_CORE_ERROR( "Invalid adapter index: {}. Only {} physical devices available.", adapterIndex, s_physicalDevices.size() );
            return nullptr;
        }

        auto device = CreateRef<Device>( s_physicalDevices[ adapterIndex ] );

        DeviceDesc desc = {};
        desc.headless   = s_config.headless;
        if( device->Init( desc ) != Result::SUCCESS )
        {
            DOV_CORE_CRITICAL( "Failed to initialize device for adapter index: {}.", adapterIndex );
            return nullptr;
        }

        return device;
    }

    void RHI::DestroyDevice( Ref<Device> device )
    {
        if( device )
        {
            device->Shutdown();
        }
    }

    Result RHI::CreateInstance( bool_t enableValidation, bool_t headless )
    {
        VkApplicationInfo appInfo  = { VK_STRUCTURE_TYPE_APPLICATION_INFO };
        appInfo.pApplicationName   = "DotObjViewer";
        appInfo.applicationVersion = VK_MAKE_API_VERSION( 0, 1, 0, 0 );
        appInfo.pEngineName        = "DotObjViewer";
        appInfo.apiVersion         = VK_API_VERSION_1_3;

        std::vector<const char*> extensions;
        std::vector<const char*> layers;

        if( !headless )
        {
            // Surface extensions for the current platform, GLFW must be initialized by now
            uint32_t     glfwCount = 0;
            const char** glfwExts  = glfwGetRequiredInstanceExtensions( &glfwCount );
            if( glfwExts == nullptr )
            {
                DOV_CORE_ERROR( "GLFW reports no Vulkan surface support on this platform." );
                return Result::FAIL;
            }
            extensions.assign( glfwExts, glfwExts + glfwCount );
        }

        if( enableValidation )
        {
            extensions.push_back( VK_EXT_DEBUG_UTILS_EXTENSION_NAME );
            layers.push_back( "VK_LAYER_KHRONOS_validation" );
        }

        VkInstanceCreateInfo createInfo    = { VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
        createInfo.pApplicationInfo        = &appInfo;
        createInfo.enabledExtensionCount   = static_cast<uint32_t>( extensions.size() );
        createInfo.ppEnabledExtensionNames = extensions.data();
        createInfo.enabledLayerCount       = static_cast<uint32_t>( layers.size() );
        createInfo.ppEnabledLayerNames     = layers.data();

        VkResult result = vkCreateInstance( &createInfo, nullptr, &s_instance );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "vkCreateInstance failed with error {}", ( int )result );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    void RHI::SetupDebugMessenger()
    {
        VkDebugUtilsMessengerCreateInfoEXT createInfo{};
        createInfo.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        createInfo.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        createInfo.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
        createInfo.pfnUserCallback = DebugCallback;

        auto vkCreateDebugUtilsMessengerEXT =
            ( PFN_vkCreateDebugUtilsMessengerEXT )vkGetInstanceProcAddr( s_instance, "vkCreateDebugUtilsMessengerEXT" );
        if( vkCreateDebugUtilsMessengerEXT == nullptr ||
            vkCreateDebugUtilsMessengerEXT( s_instance, &createInfo, nullptr, &s_debugMessenger ) != VK_SUCCESS )
        {
            DOV_CORE_WARN( "Validation requested but the debug messenger could not be created." );
        }
    }

    void RHI::EnumeratePhysicalDevices()
    {
        uint32_t count = 0;
        vkEnumeratePhysicalDevices( s_instance, &count, nullptr );
        if( count == 0 )
        {
            DOV_CORE_WARN( "No Vulkan GPUs found!" );
            return;
        }

        s_physicalDevices.resize( count );
        vkEnumeratePhysicalDevices( s_instance, &count, s_physicalDevices.data() );

        DOV_CORE_INFO( "Found {0} physical device(s):", count );
        for( const auto& device: s_physicalDevices )
        {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties( device, &props );
            DOV_CORE_INFO( "  - {0} (API: {1}.{2})", props.deviceName, VK_API_VERSION_MAJOR( props.apiVersion ),
                           VK_API_VERSION_MINOR( props.apiVersion ) );
        }
    }

    VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback( VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity, VkDebugUtilsMessageTypeFlagsEXT messageType,
                                                  const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData, void* pUserData )
    {
        ( void )messageType;
        ( void )pUserData;
        if( messageSeverity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT )
        {
            DOV_CORE_ERROR( "Validation: {0}", pCallbackData->pMessage );
        }
        else if( messageSeverity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT )
        {
            DOV_CORE_WARN( "Validation: {0}", pCallbackData->pMessage );
        }
        else
        {
            DOV_CORE_TRACE( "Validation: {0}", pCallbackData->pMessage );
        }

        return VK_FALSE;
    }

} // namespace DotObjViewer
