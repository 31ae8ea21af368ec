#include "runtime/Application.hpp"

#include "core/FileSystem.hpp"
#include "resources/MeshBuilder.hpp"
#include "rhi/RHI.hpp"
#include <GLFW/glfw3.h>
#include <filesystem>
#include <glm/gtc/constants.hpp>

namespace DotObjViewer
{
    Application::Application( const AppConfig& config )
        : m_config( config )
    {
    }

    Application::~Application()
    {
        Shutdown();
    }

    Result Application::Init()
    {
        Log::Init( m_config.logLevel );

        if( FileSystem::Init() != Result::SUCCESS )
        {
            DOV_CRITICAL( "Asset directory not found, shaders cannot be loaded." );
            return Result::FAIL;
        }

        // 1. Window (GLFW must be up before the instance asks for surface extensions)
        m_window = CreateScope<Window>( m_config.window );
        if( m_window->Init() != Result::SUCCESS )
            return Result::FAIL;

        // 2. RHI instance and device on the first adapter
        RHIConfig rhiConfig;
        rhiConfig.enableValidation = m_config.enableValidation;
        rhiConfig.headless         = false;
        if( RHI::Init( rhiConfig ) != Result::SUCCESS )
            return Result::FAIL;

        m_device = RHI::CreateDevice( 0 );
        if( !m_device )
            return Result::FAIL;

        // 3. Surface, depth buffer and frame resources
        m_context = CreateScope<DeviceContext>( m_device, m_window->GetNativeWindow(), m_window->GetWidth(), m_window->GetHeight(),
                                                m_config.window.vsync );
        if( m_context->Init() != Result::SUCCESS )
            return Result::FAIL;

        // 4. Pipelines, built once for the surface format
        m_pipelines = CreateScope<PipelineSet>( *m_device );
        if( m_pipelines->Init( m_context->GetColorFormat(), m_context->GetDepthFormat() ) != Result::SUCCESS )
            return Result::FAIL;
        if( m_context->CreateBindings( *m_pipelines ) != Result::SUCCESS )
            return Result::FAIL;

        // 5. Compositor and overlay
        m_compositor = CreateScope<FrameCompositor>( *m_context, *m_pipelines );
        if( m_compositor->Init() != Result::SUCCESS )
            return Result::FAIL;

        m_overlay = CreateScope<OverlayLayer>( m_device, *m_window, m_context->GetColorFormat(), m_context->GetSwapchain().GetImageCount() );

        const SurfaceConfig& surface = m_context->GetSurfaceConfig();
        m_camera = CreateScope<Camera>( glm::radians( 45.0f ), static_cast<float>( surface.width ) / static_cast<float>( surface.height ), 0.1f,
                                        1000.0f );

        InstallCallbacks();

        if( !m_config.initialMeshPath.empty() )
        {
            RequestLoad( m_config.initialMeshPath );
        }

        m_initialized = true;
        DOV_INFO( "DotObjViewer ready on {}", m_device->GetName() );
        return Result::SUCCESS;
    }

    void Application::InstallCallbacks()
    {
        WindowCallbacks callbacks;

        callbacks.onResize = [ this ]( uint32_t width, uint32_t height ) {
            if( m_context->Resize( width, height ) )
            {
                const SurfaceConfig& surface = m_context->GetSurfaceConfig();
                m_camera->OnResize( surface.width, surface.height );
            }
        };

        callbacks.onMouseButton = [ this ]( int button, bool pressed ) {
            if( button != GLFW_MOUSE_BUTTON_LEFT )
                return;
            // Releases always go through so a drag never gets stuck
            if( pressed && m_overlay->WantsMouse() )
                return;
            m_camera->OnOrbitButton( pressed );
        };

        callbacks.onCursorMoved = [ this ]( float x, float y ) { m_camera->OnCursorMoved( x, y ); };

        callbacks.onScroll = [ this ]( float yOffset ) {
            if( m_overlay->WantsMouse() )
                return;
            // GLFW reports wheels and trackpads alike in line units
            m_camera->ApplyZoomDelta( yOffset, ScrollUnit::LINE );
        };

        callbacks.onKey = [ this ]( int key, int action ) { OnKey( key, action ); };

        callbacks.onClose = [ this ]() { m_running = false; };

        m_window->SetCallbacks( std::move( callbacks ) );
    }

    void Application::OnKey( int key, int action )
    {
        if( action != GLFW_PRESS || m_overlay->WantsKeyboard() )
            return;

        switch( key )
        {
            case GLFW_KEY_O:
                m_overlay->OpenLoadPrompt();
                break;
            case GLFW_KEY_W:
                m_settings.ToggleWireframe();
                DOV_INFO( "Draw mode: {}", PipelineSet::ResolveWireframe( m_settings.wireframe, m_pipelines->SupportsWireframe() ) ? "wireframe"
                                                                                                                                     : "solid" );
                break;
            case GLFW_KEY_TAB:
                m_settings.ToggleOverlayDetail();
                break;
            case GLFW_KEY_Q:
            case GLFW_KEY_ESCAPE:
                m_running = false;
                break;
            default:
                break;
        }
    }

    int Application::Run()
    {
        if( !m_initialized )
        {
            DOV_CRITICAL( "Application::Run called before a successful Init!" );
            return 1;
        }

        DOV_INFO( "Main loop started." );
        m_running = true;

        while( m_running && !m_window->IsClosed() )
        {
            m_window->PollEvents();

            std::string path;
            if( m_overlay->PollLoadRequest( path ) )
            {
                RequestLoad( path );
            }
            ProcessPendingLoad();

            // Minimized: nothing to present until the framebuffer has an area again
            if( m_window->GetWidth() == 0 || m_window->GetHeight() == 0 )
            {
                m_window->WaitEvents();
                continue;
            }

            m_overlay->Draw( GatherOverlayData() );

            const MeshBuffer* mesh   = m_mesh.IsLoaded() ? &m_mesh : nullptr;
            SurfaceStatus     status = m_compositor->RenderFrame( *m_camera, mesh, m_settings, m_overlay.get() );
            HandleSurfaceStatus( status );

            m_monitor.Update();
            uint64_t gpuUsed = 0, gpuBudget = 0;
            m_device->QueryMemoryBudget( gpuUsed, gpuBudget );
            m_monitor.SetGpuMemory( gpuUsed, gpuBudget );
        }

        DOV_INFO( "Main loop finished after {} frames.", m_monitor.GetStats().frameCount );
        return m_exitCode;
    }

    void Application::HandleSurfaceStatus( SurfaceStatus status )
    {
        switch( status )
        {
            case SurfaceStatus::READY:
            case SurfaceStatus::SUBOPTIMAL:
                break;

            case SurfaceStatus::OUT_OF_DATE:
            case SurfaceStatus::LOST:
                // Retried every frame until it succeeds
                DOV_CORE_ERROR( "Surface {}, reconfiguring and skipping the frame.", toString( status ) );
                if( m_context->Reconfigure( status ) == Result::SUCCESS )
                {
                    const SurfaceConfig& surface = m_context->GetSurfaceConfig();
                    m_camera->OnResize( surface.width, surface.height );
                }
                break;

            case SurfaceStatus::OUT_OF_MEMORY:
                DOV_CORE_CRITICAL( "GPU out of memory, shutting down." );
                m_exitCode = 1;
                m_running  = false;
                break;

            case SurfaceStatus::FAILED:
            default:
                DOV_CORE_ERROR( "Frame dropped ({}).", toString( status ) );
                break;
        }
    }

    void Application::ProcessPendingLoad()
    {
        if( m_pendingLoad.empty() )
            return;

        std::string path = std::move( m_pendingLoad );
        m_pendingLoad.clear();
        LoadMesh( path );
    }

    Result Application::LoadMesh( const std::string& path )
    {
        DOV_INFO( "Loading OBJ file: {}", path );

        Mesh        mesh;
        std::string error;
        Result      res = MeshBuilder::LoadFromFile( path, mesh, error );
        if( res != Result::SUCCESS )
        {
            DOV_ERROR( "Failed to load mesh ({}): {}", toString( res ), error );
            m_lastError = error;
            return res;
        }

        // The last submitted frame may still read the current buffers
        m_device->WaitIdle();

        res = m_mesh.Upload( *m_device, mesh );
        if( res != Result::SUCCESS )
        {
            m_lastError = path + ": upload failed (" + std::string( toString( res ) ) + ")";
            DOV_ERROR( "{}", m_lastError );
            return res;
        }

        m_meshName = std::filesystem::path( path ).filename().string();
        m_lastError.clear();
        m_camera->AutoFit( mesh.boundsMin, mesh.boundsMax );

        DOV_INFO( "Loaded mesh with {} vertices and {} indices", mesh.vertices.size(), mesh.indices.size() );
        return Result::SUCCESS;
    }

    OverlayData Application::GatherOverlayData() const
    {
        OverlayData data;
        data.stats              = m_monitor.GetStats();
        data.meshLoaded         = m_mesh.IsLoaded();
        data.meshName           = m_meshName;
        data.vertexCount        = m_mesh.GetVertexCount();
        data.triangleCount      = m_mesh.GetTriangleCount();
        data.wireframe          = m_settings.wireframe;
        data.wireframeSupported = m_pipelines->SupportsWireframe();
        data.detail             = m_settings.overlayDetail;
        data.lastError          = m_lastError;
        return data;
    }

    void Application::Shutdown()
    {
        if( m_device )
        {
            m_device->WaitIdle();
        }

        // Reverse of Init
        m_overlay.reset();
        m_compositor.reset();
        m_mesh.Release();
        m_pipelines.reset();
        m_context.reset();
        m_camera.reset();

        if( m_device )
        {
            RHI::DestroyDevice( m_device );
            m_device.reset();
        }

        if( RHI::IsInitialized() )
        {
            RHI::Shutdown();
        }
        m_window.reset();
        m_initialized = false;
    }
} // namespace DotObjViewer
