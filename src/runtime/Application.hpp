#pragma once
#include "core/Base.hpp"
#include "platform/PerformanceMonitor.hpp"
#include "platform/Window.hpp"
#include "renderer/Camera.hpp"
#include "renderer/DeviceContext.hpp"
#include "renderer/FrameCompositor.hpp"
#include "renderer/OverlayLayer.hpp"
#include "renderer/PipelineSet.hpp"
#include "renderer/RenderSettings.hpp"
#include "resources/MeshBuffer.hpp"
#include "rhi/Device.hpp"
#include "runtime/AppConfig.hpp"
#include <string>

namespace DotObjViewer
{
    /**
     * @brief The viewer: owns the window, the GPU objects and the frame loop.
     * Input events mutate the camera and the render settings between frames. Mesh
     * loads are queued and run between frames, never during RenderFrame().
     */
    class Application
    {
    public:
        Application( const AppConfig& config );
        ~Application();

        Application( const Application& )            = delete;
        Application& operator=( const Application& ) = delete;

        /**
         * @brief Brings up logging, window, device and renderer, in that order.
         * @return Result::FAIL if any mandatory part cannot be created.
         */
        Result Init();

        /**
         * @brief Runs the frame loop until the window closes or the user quits.
         * @return Process exit code, non-zero after a fatal GPU error.
         */
        int Run();

        // Queues a load, executed before the next frame
        void RequestLoad( const std::string& path ) { m_pendingLoad = path; }

    private:
        void InstallCallbacks();
        void ProcessPendingLoad();
        Result LoadMesh( const std::string& path );
        void HandleSurfaceStatus( SurfaceStatus status );
        void OnKey( int key, int action );
        OverlayData GatherOverlayData() const;
        void Shutdown();

    private:
        AppConfig m_config;
        bool_t    m_initialized = false;
        bool_t    m_running     = false;
        int       m_exitCode    = 0;

        Scope<Window>          m_window;
        Ref<Device>            m_device;
        Scope<DeviceContext>   m_context;
        Scope<PipelineSet>     m_pipelines;
        Scope<FrameCompositor> m_compositor;
        Scope<OverlayLayer>    m_overlay;
        Scope<Camera>          m_camera;

        RenderSettings     m_settings;
        MeshBuffer         m_mesh;
        std::string        m_meshName;
        PerformanceMonitor m_monitor;

        std::string m_pendingLoad;
        std::string m_lastError;
    };
} // namespace DotObjViewer
