#pragma once
#include "core/Base.hpp"
#include <string_view>
#include <vector>
#include <volk.h>

namespace DotObjViewer
{
    /**
     * @brief Outcome of an acquire or present call, classified for the frame loop.
     * OUT_OF_DATE and LOST are recoverable by reconfiguring, OUT_OF_MEMORY is fatal,
     * FAILED drops the frame.
     */
    enum class SurfaceStatus
    {
        READY,
        SUBOPTIMAL,
        OUT_OF_DATE,
        LOST,
        OUT_OF_MEMORY,
        FAILED
    };

    std::string_view toString( SurfaceStatus status );

    struct SwapchainDesc
    {
        void*    windowHandle = nullptr; // Raw GLFWwindow pointer
        uint32_t width        = 0;
        uint32_t height       = 0;
        bool     vsync        = true;
    };

    class Swapchain
    {
    public:
        Swapchain( VkDevice device, VkPhysicalDevice physicalDevice, VkInstance instance, VkQueue presentQueue, uint32_t presentQueueFamilyIndex,
                   const VolkDeviceTable* api, const SwapchainDesc& desc );
        ~Swapchain();

        /**
         * @brief Creates surface, swapchain, image views and semaphores.
         */
        Result Create();

        /**
         * @brief Rebuilds the swapchain for a new size. The surface is kept.
         * Zero-area sizes are stored but do not rebuild anything.
         */
        Result Recreate( uint32_t width, uint32_t height );

        /**
         * @brief Destroys and re-creates the surface itself, then the swapchain.
         * Used after VK_ERROR_SURFACE_LOST_KHR.
         */
        Result RecreateSurface();

        /**
         * @brief Requests the next image from the presentation engine.
         * @param outImageIndex [Out] Index of the acquired image.
         * @param outAvailable [Out] Semaphore signaled once the image can be written.
         */
        SurfaceStatus AcquireNextImage( uint32_t& outImageIndex, VkSemaphore& outAvailable );

        /**
         * @brief Presents the last acquired image once 'waitSemaphore' is signaled.
         */
        SurfaceStatus Present( VkSemaphore waitSemaphore );

        // Signaled by the frame's submit, waited by present. One per image.
        VkSemaphore GetRenderFinishedSemaphore( uint32_t imageIndex ) const { return m_renderFinishedSemaphores[ imageIndex ]; }

        VkFormat    GetFormat() const { return m_surfaceFormat.format; }
        VkExtent2D  GetExtent() const { return m_extent; }
        VkImageView GetImageView( uint32_t index ) const { return m_imageViews[ index ]; }
        VkImage     GetImage( uint32_t index ) const { return m_images[ index ]; }
        uint32_t    GetImageCount() const { return static_cast<uint32_t>( m_images.size() ); }
        uint32_t    GetMinImageCount() const { return m_minImageCount; }

        static SurfaceStatus      ToSurfaceStatus( VkResult result );
        static VkSurfaceFormatKHR ChooseSurfaceFormat( const std::vector<VkSurfaceFormatKHR>& formats );
        static bool_t             IsSrgbFormat( VkFormat format );

    public:
        Swapchain( const Swapchain& )            = delete;
        Swapchain& operator=( const Swapchain& ) = delete;

    private:
        Result CreateSurface();
        Result CreateSwapchain();
        Result CreateImageViews();
        Result CreateSyncObjects();
        void   DestroySyncObjects();
        void   CleanupSwapchain(); // Destroys images/views/swapchain but keeps surface

    private:
        VkDevice               m_deviceHandle;
        VkPhysicalDevice       m_physicalDevice;
        VkInstance             m_instance;
        VkQueue                m_presentQueue;
        uint32_t               m_presentQueueFamilyIndex;
        const VolkDeviceTable* m_api;

        SwapchainDesc m_desc;

        VkSurfaceKHR   m_surface   = VK_NULL_HANDLE;
        VkSwapchainKHR m_swapchain = VK_NULL_HANDLE;

        VkSurfaceFormatKHR m_surfaceFormat = {};
        VkPresentModeKHR   m_presentMode   = VK_PRESENT_MODE_FIFO_KHR;
        VkExtent2D         m_extent        = { 0, 0 };
        uint32_t           m_minImageCount = 2;

        std::vector<VkImage>     m_images;
        std::vector<VkImageView> m_imageViews;

        // Acquire semaphores rotate, render-finished ones are indexed by image
        std::vector<VkSemaphore> m_imageAvailableSemaphores;
        std::vector<VkSemaphore> m_renderFinishedSemaphores;

        uint32_t m_currentSemaphore  = 0;
        uint32_t m_currentImageIndex = 0;
    };
} // namespace DotObjViewer
