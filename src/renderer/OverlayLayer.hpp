#pragma once
#include "core/Base.hpp"
#include "platform/PerformanceMonitor.hpp"
#include "platform/Window.hpp"
#include "rhi/CommandBuffer.hpp"
#include "rhi/Device.hpp"
#include <string>

namespace DotObjViewer
{
    // Everything the overlay displays, gathered by the application each frame
    struct OverlayData
    {
        PerformanceStats stats;
        bool_t           meshLoaded         = false;
        std::string      meshName;
        uint32_t         vertexCount        = 0;
        uint32_t         triangleCount      = 0;
        bool_t           wireframe          = false;
        bool_t           wireframeSupported = true;
        bool_t           detail             = false;
        std::string      lastError;
    };

    /**
     * @brief Dear ImGui overlay drawn on top of the 3D pass.
     * Shows the performance readout and the "open mesh" prompt.
     */
    class OverlayLayer
    {
    public:
        /**
         * @brief Initializes ImGui with Vulkan backend (Dynamic Rendering).
         * @param device Reference to the RHI Device.
         * @param window The OS window, its GLFW callbacks get chained by ImGui.
         * @param colorFormat The format of the swapchain images (needed for pipeline creation).
         * @param imageCount Number of swapchain images.
         */
        OverlayLayer( Ref<Device> device, Window& window, VkFormat colorFormat, uint32_t imageCount );
        ~OverlayLayer();

        OverlayLayer( const OverlayLayer& )            = delete;
        OverlayLayer& operator=( const OverlayLayer& ) = delete;

        // Starts a new ImGui frame and builds the widgets
        void Draw( const OverlayData& data );

        // Records the ImGui draw lists, call inside a render pass on the swapchain image
        void Render( CommandBuffer& cmd );

        // Opens the path prompt on the next Draw()
        void OpenLoadPrompt() { m_promptRequested = true; }

        /**
         * @brief Returns the path confirmed in the prompt since the last call.
         * @return false if nothing was confirmed.
         */
        bool_t PollLoadRequest( std::string& outPath );

        // Returns true if ImGui wants to capture mouse input (block camera)
        bool_t WantsMouse() const;
        // True while a text field has focus, key bindings must not fire then
        bool_t WantsKeyboard() const;

    private:
        void DrawStats( const OverlayData& data );
        void DrawLoadPrompt();

    private:
        Ref<Device>      m_device;
        VkDescriptorPool m_pool      = VK_NULL_HANDLE;
        bool_t           m_frameOpen = false;

        bool_t      m_promptRequested = false;
        char        m_pathBuffer[ 1024 ] = {};
        bool_t      m_hasRequest         = false;
        std::string m_requestedPath;
    };
} // namespace DotObjViewer
