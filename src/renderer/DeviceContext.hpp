#pragma once
#include "core/Base.hpp"
#include "renderer/Uniforms.hpp"
#include "rhi/BindingGroup.hpp"
#include "rhi/Buffer.hpp"
#include "rhi/CommandBuffer.hpp"
#include "rhi/Device.hpp"
#include "rhi/Swapchain.hpp"
#include "rhi/Texture.hpp"

namespace DotObjViewer
{
    class PipelineSet;

    /**
     * @brief Size and format the surface is currently configured with.
     */
    struct SurfaceConfig
    {
        uint32_t width  = 0;
        uint32_t height = 0;
        VkFormat format = VK_FORMAT_UNDEFINED;

        /**
         * @return false when the size has zero area or equals the current one.
         * The size itself is only stored once the surface has been reconfigured.
         */
        bool_t NeedsResize( uint32_t newWidth, uint32_t newHeight ) const
        {
            if( newWidth == 0 || newHeight == 0 )
                return false;
            return newWidth != width || newHeight != height;
        }
    };

    /**
     * @brief Owns everything the frame loop renders into: swapchain, depth buffer,
     * per-frame uniforms and the frame command buffer.
     * The device and queue are never recreated, only size-dependent resources are.
     * One frame is in flight at a time.
     */
    class DeviceContext
    {
    public:
        DeviceContext( Ref<Device> device, void* windowHandle, uint32_t width, uint32_t height, bool vsync = true );
        ~DeviceContext();

        Result Init();
        void   Shutdown();

        /**
         * @brief Allocates the camera/light descriptor set for the pipelines' shared layout.
         * Must be called once after the pipelines exist.
         */
        Result CreateBindings( const PipelineSet& pipelines );

        /**
         * @brief Reconfigures the surface for a new window size.
         * Zero-area sizes (minimized window) are ignored.
         * @return true if the surface and depth buffer were rebuilt.
         */
        bool_t Resize( uint32_t width, uint32_t height );

        /**
         * @brief Recovers from an OUT_OF_DATE or LOST surface at the current size.
         */
        Result Reconfigure( SurfaceStatus status );

        // Overwrites both uniform blocks, the GPU must not be reading them
        void WriteUniforms( const FrameUniforms& frame, const LightUniforms& light );

        // Blocks until the last submitted frame has finished on the GPU
        Result WaitForLastFrame();
        void   SetLastSubmittedValue( uint64_t value ) { m_lastSubmittedValue = value; }

        Device&              GetDevice() { return *m_device; }
        const Ref<Device>&   GetDeviceRef() const { return m_device; }
        Swapchain&           GetSwapchain() { return *m_swapchain; }
        const Texture&       GetDepthTexture() const { return *m_depth; }
        const SurfaceConfig& GetSurfaceConfig() const { return m_surface; }
        CommandBuffer&       GetFrameCommandBuffer() { return *m_frameCmd; }
        const BindingGroup&  GetBindings() const { return *m_bindings; }
        VkFormat             GetColorFormat() const { return m_surface.format; }
        VkFormat             GetDepthFormat() const { return m_depthFormat; }

    private:
        Result CreateDepthBuffer();

    private:
        Ref<Device>    m_device;
        void*          m_windowHandle;
        bool           m_vsync;
        Ref<Swapchain> m_swapchain;
        Ref<Texture>   m_depth;
        VkFormat       m_depthFormat = VK_FORMAT_D32_SFLOAT;
        SurfaceConfig  m_surface;

        Ref<Buffer>         m_frameUniforms;
        Ref<Buffer>         m_lightUniforms;
        Scope<BindingGroup> m_bindings;

        Ref<CommandBuffer> m_frameCmd;
        uint64_t           m_lastSubmittedValue = 0;
    };
} // namespace DotObjViewer
