#include "rhi/Swapchain.hpp"

#include <GLFW/glfw3.h>
#include <algorithm>
#include <limits>

namespace DotObjViewer
{
    std::string_view toString( SurfaceStatus status )
    {
        switch( status )
        {
            case SurfaceStatus::READY:
                return "READY";
            case SurfaceStatus::SUBOPTIMAL:
                return "SUBOPTIMAL";
            case SurfaceStatus::OUT_OF_DATE:
                return "OUT_OF_DATE";
            case SurfaceStatus::LOST:
                return "LOST";
            case SurfaceStatus::OUT_OF_MEMORY:
                return "OUT_OF_MEMORY";
            case SurfaceStatus::FAILED:
            default:
                return "FAILED";
        }
    }

    SurfaceStatus Swapchain::ToSurfaceStatus( VkResult result )
    {
        switch( result )
        {
            case VK_SUCCESS:
                return SurfaceStatus::READY;
            case VK_SUBOPTIMAL_KHR:
                return SurfaceStatus::SUBOPTIMAL;
            case VK_ERROR_OUT_OF_DATE_KHR:
                return SurfaceStatus::OUT_OF_DATE;
            case VK_ERROR_SURFACE_LOST_KHR:
                return SurfaceStatus::LOST;
            case VK_ERROR_OUT_OF_HOST_MEMORY:
            case VK_ERROR_OUT_OF_DEVICE_MEMORY:
                return SurfaceStatus::OUT_OF_MEMORY;
            default:
                return SurfaceStatus::FAILED;
        }
    }

    bool_t Swapchain::IsSrgbFormat( VkFormat format )
    {
        switch( format )
        {
            case VK_FORMAT_B8G8R8A8_SRGB:
            case VK_FORMAT_R8G8B8A8_SRGB:
            case VK_FORMAT_A8B8G8R8_SRGB_PACK32:
            case VK_FORMAT_B8G8R8_SRGB:
            case VK_FORMAT_R8G8B8_SRGB:
                return true;
            default:
                return false;
        }
    }

    VkSurfaceFormatKHR Swapchain::ChooseSurfaceFormat( const std::vector<VkSurfaceFormatKHR>& formats )
    {
        if( formats.empty() )
        {
            return { VK_FORMAT_UNDEFINED, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR };
        }

        for( const auto& fmt: formats )
        {
            if( IsSrgbFormat( fmt.format ) && fmt.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR )
            {
                return fmt;
            }
        }
        return formats[ 0 ];
    }

    Swapchain::Swapchain( VkDevice device, VkPhysicalDevice physicalDevice, VkInstance instance, VkQueue presentQueue,
                          uint32_t presentQueueFamilyIndex, const VolkDeviceTable* api, const SwapchainDesc& desc )
        : m_deviceHandle( device )
        , m_physicalDevice( physicalDevice )
        , m_instance( instance )
        , m_presentQueue( presentQueue )
        , m_presentQueueFamilyIndex( presentQueueFamilyIndex )
        , m_api( api )
        , m_desc( desc )
    {
        DOV_CORE_ASSERT( m_api, "API table is null!" );
    }

    Swapchain::~Swapchain()
    {
        if( m_deviceHandle )
        {
            m_api->vkDeviceWaitIdle( m_deviceHandle );
        }

        CleanupSwapchain();
        DestroySyncObjects();

        if( m_surface != VK_NULL_HANDLE )
        {
            vkDestroySurfaceKHR( m_instance, m_surface, nullptr );
        }
    }

    Result Swapchain::Create()
    {
        Result res = CreateSurface();
        if( res != Result::SUCCESS )
            return res;

        res = CreateSwapchain();
        if( res != Result::SUCCESS )
            return res;

        res = CreateImageViews();
        if( res != Result::SUCCESS )
            return res;

        return CreateSyncObjects();
    }

    Result Swapchain::CreateSurface()
    {
        // GLFW requires the instance to create a surface
        if( glfwCreateWindowSurface( m_instance, static_cast<GLFWwindow*>( m_desc.windowHandle ), nullptr, &m_surface ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create window surface!" );
            m_surface = VK_NULL_HANDLE;
            return Result::FAIL;
        }

        VkBool32 supported = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR( m_physicalDevice, m_presentQueueFamilyIndex, m_surface, &supported );
        if( !supported )
        {
            DOV_CORE_ERROR( "Queue family {} cannot present to this surface!", m_presentQueueFamilyIndex );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    void Swapchain::CleanupSwapchain()
    {
        for( auto view: m_imageViews )
        {
            m_api->vkDestroyImageView( m_deviceHandle, view, nullptr );
        }
        m_imageViews.clear();
        m_images.clear();

        if( m_swapchain != VK_NULL_HANDLE )
        {
            m_api->vkDestroySwapchainKHR( m_deviceHandle, m_swapchain, nullptr );
            m_swapchain = VK_NULL_HANDLE;
        }
    }

    Result Swapchain::Recreate( uint32_t width, uint32_t height )
    {
        m_desc.width  = width;
        m_desc.height = height;

        if( width == 0 || height == 0 )
            return Result::SUCCESS;

        m_api->vkDeviceWaitIdle( m_deviceHandle );
        CleanupSwapchain();
        DestroySyncObjects();

        Result res = CreateSwapchain();
        if( res != Result::SUCCESS )
            return res;
        res = CreateImageViews();
        if( res != Result::SUCCESS )
            return res;
        return CreateSyncObjects();
    }

    Result Swapchain::RecreateSurface()
    {
        m_api->vkDeviceWaitIdle( m_deviceHandle );
        CleanupSwapchain();
        DestroySyncObjects();

        if( m_surface != VK_NULL_HANDLE )
        {
            vkDestroySurfaceKHR( m_instance, m_surface, nullptr );
            m_surface = VK_NULL_HANDLE;
        }

        DOV_CORE_WARN( "Surface lost, re-creating it." );
        return Create();
    }

    Result Swapchain::CreateSwapchain()
    {
        VkSurfaceCapabilitiesKHR capabilities;
        VkResult                 capsResult = vkGetPhysicalDeviceSurfaceCapabilitiesKHR( m_physicalDevice, m_surface, &capabilities );
        if( capsResult != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to query surface capabilities! Error: {}", ( int )capsResult );
            return Result::FAIL;
        }

        uint32_t formatCount = 0;
        vkGetPhysicalDeviceSurfaceFormatsKHR( m_physicalDevice, m_surface, &formatCount, nullptr );
        std::vector<VkSurfaceFormatKHR> formats( formatCount );
        vkGetPhysicalDeviceSurfaceFormatsKHR( m_physicalDevice, m_surface, &formatCount, formats.data() );

        uint32_t presentModeCount = 0;
        vkGetPhysicalDeviceSurfacePresentModesKHR( m_physicalDevice, m_surface, &presentModeCount, nullptr );
        std::vector<VkPresentModeKHR> presentModes( presentModeCount );
        vkGetPhysicalDeviceSurfacePresentModesKHR( m_physicalDevice, m_surface, &presentModeCount, presentModes.data() );

        if( formats.empty() )
        {
            DOV_CORE_ERROR( "Surface reports no supported formats!" );
            return Result::FAIL;
        }

        m_surfaceFormat = ChooseSurfaceFormat( formats );
        if( !IsSrgbFormat( m_surfaceFormat.format ) )
        {
            DOV_CORE_WARN( "No sRGB surface format offered, using format {}", ( int )m_surfaceFormat.format );
        }

        // Mailbox if available and no vsync, else FIFO
        m_presentMode = VK_PRESENT_MODE_FIFO_KHR;
        if( !m_desc.vsync )
        {
            for( const auto& mode: presentModes )
            {
                if( mode == VK_PRESENT_MODE_MAILBOX_KHR )
                {
                    m_presentMode = mode;
                    break;
                }
            }
        }

        if( capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max() )
        {
            m_extent = capabilities.currentExtent;
        }
        else
        {
            VkExtent2D actual = { m_desc.width, m_desc.height };
            actual.width      = std::clamp( actual.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width );
            actual.height     = std::clamp( actual.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height );
            m_extent          = actual;
        }

        if( m_extent.width == 0 || m_extent.height == 0 )
        {
            // Minimized, nothing to build until the window gets an area again
            DOV_CORE_TRACE( "Surface has zero extent, swapchain creation deferred." );
            return Result::SUCCESS;
        }

        uint32_t imageCount = capabilities.minImageCount + 1;
        if( capabilities.maxImageCount > 0 && imageCount > capabilities.maxImageCount )
        {
            imageCount = capabilities.maxImageCount;
        }
        m_minImageCount = capabilities.minImageCount;

        VkSwapchainCreateInfoKHR createInfo = { VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR };
        createInfo.surface                  = m_surface;
        createInfo.minImageCount            = imageCount;
        createInfo.imageFormat              = m_surfaceFormat.format;
        createInfo.imageColorSpace          = m_surfaceFormat.colorSpace;
        createInfo.imageExtent              = m_extent;
        createInfo.imageArrayLayers         = 1;
        createInfo.imageUsage               = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
        createInfo.imageSharingMode         = VK_SHARING_MODE_EXCLUSIVE; // Present queue is the graphics queue
        createInfo.preTransform             = capabilities.currentTransform;
        createInfo.compositeAlpha           = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        createInfo.presentMode              = m_presentMode;
        createInfo.clipped                  = VK_TRUE;
        createInfo.oldSwapchain             = VK_NULL_HANDLE;

        VkResult result = m_api->vkCreateSwapchainKHR( m_deviceHandle, &createInfo, nullptr, &m_swapchain );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create swapchain! Error: {}", ( int )result );
            m_swapchain = VK_NULL_HANDLE;
            return result == VK_ERROR_OUT_OF_DEVICE_MEMORY || result == VK_ERROR_OUT_OF_HOST_MEMORY ? Result::OUT_OF_MEMORY : Result::FAIL;
        }

        m_api->vkGetSwapchainImagesKHR( m_deviceHandle, m_swapchain, &imageCount, nullptr );
        m_images.resize( imageCount );
        m_api->vkGetSwapchainImagesKHR( m_deviceHandle, m_swapchain, &imageCount, m_images.data() );

        DOV_CORE_INFO( "Swapchain created: {}x{}, {} images, format {}", m_extent.width, m_extent.height, imageCount,
                       ( int )m_surfaceFormat.format );
        return Result::SUCCESS;
    }

    Result Swapchain::CreateImageViews()
    {
        m_imageViews.resize( m_images.size(), VK_NULL_HANDLE );
        for( size_t i = 0; i < m_images.size(); i++ )
        {
            VkImageViewCreateInfo viewInfo           = { VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO };
            viewInfo.image                           = m_images[ i ];
            viewInfo.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
            viewInfo.format                          = m_surfaceFormat.format;
            viewInfo.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
            viewInfo.subresourceRange.baseMipLevel   = 0;
            viewInfo.subresourceRange.levelCount     = 1;
            viewInfo.subresourceRange.baseArrayLayer = 0;
            viewInfo.subresourceRange.layerCount     = 1;

            if( m_api->vkCreateImageView( m_deviceHandle, &viewInfo, nullptr, &m_imageViews[ i ] ) != VK_SUCCESS )
            {
                DOV_CORE_ERROR( "Failed to create swapchain image view!" );
                m_imageViews[ i ] = VK_NULL_HANDLE;
                return Result::FAIL;
            }
        }
        return Result::SUCCESS;
    }

    Result Swapchain::CreateSyncObjects()
    {
        VkSemaphoreCreateInfo semaphoreInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };

        // One spare acquire semaphore so the next acquire never reuses a pending one
        m_imageAvailableSemaphores.resize( m_images.size() + 1, VK_NULL_HANDLE );
        m_renderFinishedSemaphores.resize( m_images.size(), VK_NULL_HANDLE );

        for( auto& sem: m_imageAvailableSemaphores )
        {
            if( m_api->vkCreateSemaphore( m_deviceHandle, &semaphoreInfo, nullptr, &sem ) != VK_SUCCESS )
            {
                DOV_CORE_ERROR( "Failed to create swapchain semaphore!" );
                sem = VK_NULL_HANDLE;
                return Result::FAIL;
            }
        }
        for( auto& sem: m_renderFinishedSemaphores )
        {
            if( m_api->vkCreateSemaphore( m_deviceHandle, &semaphoreInfo, nullptr, &sem ) != VK_SUCCESS )
            {
                DOV_CORE_ERROR( "Failed to create swapchain semaphore!" );
                sem = VK_NULL_HANDLE;
                return Result::FAIL;
            }
        }
        m_currentSemaphore = 0;
        return Result::SUCCESS;
    }

    void Swapchain::DestroySyncObjects()
    {
        for( auto sem: m_imageAvailableSemaphores )
        {
            if( sem )
                m_api->vkDestroySemaphore( m_deviceHandle, sem, nullptr );
        }
        for( auto sem: m_renderFinishedSemaphores )
        {
            if( sem )
                m_api->vkDestroySemaphore( m_deviceHandle, sem, nullptr );
        }
        m_imageAvailableSemaphores.clear();
        m_renderFinishedSemaphores.clear();
    }

    SurfaceStatus Swapchain::AcquireNextImage( uint32_t& outImageIndex, VkSemaphore& outAvailable )
    {
        if( m_swapchain == VK_NULL_HANDLE )
        {
            return SurfaceStatus::OUT_OF_DATE;
        }

        VkSemaphore semaphore = m_imageAvailableSemaphores[ m_currentSemaphore ];
        VkResult    result    = m_api->vkAcquireNextImageKHR( m_deviceHandle, m_swapchain, UINT64_MAX, semaphore, VK_NULL_HANDLE, &outImageIndex );

        SurfaceStatus status = ToSurfaceStatus( result );
        if( status == SurfaceStatus::READY || status == SurfaceStatus::SUBOPTIMAL )
        {
            m_currentImageIndex = outImageIndex;
            outAvailable        = semaphore;
            m_currentSemaphore  = ( m_currentSemaphore + 1 ) % static_cast<uint32_t>( m_imageAvailableSemaphores.size() );
        }
        return status;
    }

    SurfaceStatus Swapchain::Present( VkSemaphore waitSemaphore )
    {
        VkPresentInfoKHR presentInfo   = { VK_STRUCTURE_TYPE_PRESENT_INFO_KHR };
        presentInfo.waitSemaphoreCount = 1;
        presentInfo.pWaitSemaphores    = &waitSemaphore;
        presentInfo.swapchainCount     = 1;
        presentInfo.pSwapchains        = &m_swapchain;
        presentInfo.pImageIndices      = &m_currentImageIndex;

        return ToSurfaceStatus( m_api->vkQueuePresentKHR( m_presentQueue, &presentInfo ) );
    }
} // namespace DotObjViewer
