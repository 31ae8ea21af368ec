#include "renderer/OverlayLayer.hpp"

#include "rhi/RHI.hpp"
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_vulkan.h>
#include <imgui.h>

namespace DotObjViewer
{
    static const char* LOAD_PROMPT_ID = "Open OBJ";

    OverlayLayer::OverlayLayer( Ref<Device> device, Window& window, VkFormat colorFormat, uint32_t imageCount )
        : m_device( device )
    {
        DOV_CORE_INFO( "Initializing overlay (Dynamic Rendering)..." );

        // ImGui only needs a handful of image samplers for its font atlas
        std::vector<VkDescriptorPoolSize> poolSizes = { { VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 16 } };
        m_pool = m_device->CreateDescriptorPool( 16, poolSizes, VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT );

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();

        ImGuiIO& io    = ImGui::GetIO();
        io.IniFilename = nullptr; // Overlay layout is fixed, nothing to persist

        ImGui::StyleColorsDark();

        // Installs callbacks that chain to the ones the Window already registered
        ImGui_ImplGlfw_InitForVulkan( ( GLFWwindow* )window.GetNativeWindow(), true );
        ImGui_ImplVulkan_LoadFunctions(
            VK_API_VERSION_1_3, []( const char* function_name, void* ) { return vkGetInstanceProcAddr( RHI::GetInstance(), function_name ); },
            nullptr );

        ImGui_ImplVulkan_InitInfo init_info = {};
        init_info.Instance                  = RHI::GetInstance();
        init_info.PhysicalDevice            = m_device->GetPhysicalDevice();
        init_info.Device                    = m_device->GetHandle();
        init_info.QueueFamily               = m_device->GetGraphicsQueue()->GetFamilyIndex();
        init_info.Queue                     = m_device->GetGraphicsQueue()->GetHandle();
        init_info.DescriptorPool            = m_pool;
        init_info.MinImageCount             = imageCount < 2 ? 2 : imageCount;
        init_info.ImageCount                = imageCount < 2 ? 2 : imageCount;
        init_info.ApiVersion                = VK_API_VERSION_1_3;

        // --- Dynamic Rendering Setup ---
        init_info.UseDynamicRendering = true;

        VkPipelineRenderingCreateInfoKHR pipelineInfo = { VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO_KHR };
        pipelineInfo.colorAttachmentCount             = 1;
        pipelineInfo.pColorAttachmentFormats          = &colorFormat;
        // The overlay pass has no depth attachment
        pipelineInfo.depthAttachmentFormat = VK_FORMAT_UNDEFINED;

        init_info.PipelineInfoMain.MSAASamples                 = VK_SAMPLE_COUNT_1_BIT;
        init_info.PipelineInfoMain.PipelineRenderingCreateInfo = pipelineInfo;

        ImGui_ImplVulkan_Init( &init_info );
    }

    OverlayLayer::~OverlayLayer()
    {
        DOV_CORE_INFO( "Shutting down overlay..." );
        m_device->WaitIdle();

        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        m_device->DestroyDescriptorPool( m_pool );
    }

    void OverlayLayer::Draw( const OverlayData& data )
    {
        // A skipped frame never reached Render()
        if( m_frameOpen )
        {
            ImGui::EndFrame();
        }

        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
        m_frameOpen = true;

        DrawStats( data );
        DrawLoadPrompt();

        if( !data.lastError.empty() )
        {
            ImGuiViewport* viewport = ImGui::GetMainViewport();
            ImGui::SetNextWindowPos( ImVec2( viewport->WorkPos.x + 10.0f, viewport->WorkPos.y + viewport->WorkSize.y - 10.0f ),
                                     ImGuiCond_Always, ImVec2( 0.0f, 1.0f ) );
            ImGui::SetNextWindowBgAlpha( 0.6f );
            ImGui::Begin( "##LoadError", nullptr,
                          ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings |
                              ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav );
            ImGui::TextColored( ImVec4( 1.0f, 0.4f, 0.4f, 1.0f ), "Load failed: %s", data.lastError.c_str() );
            ImGui::End();
        }
    }

    void OverlayLayer::DrawStats( const OverlayData& data )
    {
        ImGuiViewport* viewport = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos( ImVec2( viewport->WorkPos.x + 10.0f, viewport->WorkPos.y + 10.0f ), ImGuiCond_Always );
        ImGui::SetNextWindowBgAlpha( 0.45f );

        ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;

        ImGui::Begin( "##Stats", nullptr, flags );
        const PerformanceStats& stats = data.stats;
        ImGui::Text( "FPS: %.1f (%.2f ms)", stats.fps, stats.frameTimeMs );

        if( data.detail )
        {
            ImGui::Separator();
            ImGui::Text( "CPU: %.1f%%", stats.cpuUsage );
            ImGui::Text( "Memory: %.1f%% (%llu / %llu MB)", stats.memoryUsage, ( unsigned long long )stats.memoryUsedMB,
                         ( unsigned long long )stats.memoryTotalMB );
            if( stats.hasGpuMemory )
            {
                ImGui::Text( "GPU memory: %llu / %llu MB", ( unsigned long long )stats.gpuMemoryUsedMB,
                             ( unsigned long long )stats.gpuMemoryTotalMB );
            }
            ImGui::Text( "Frames: %llu", ( unsigned long long )stats.frameCount );

            ImGui::Separator();
            if( data.meshLoaded )
            {
                ImGui::Text( "Mesh: %s", data.meshName.c_str() );
                ImGui::Text( "Vertices: %u  Triangles: %u", data.vertexCount, data.triangleCount );
            }
            else
            {
                ImGui::TextUnformatted( "Mesh: placeholder triangle" );
            }

            ImGui::Text( "Mode: %s", data.wireframe && data.wireframeSupported ? "wireframe" : "solid" );
            if( data.wireframe && !data.wireframeSupported )
            {
                ImGui::TextDisabled( "(wireframe not supported on this device)" );
            }

            ImGui::Separator();
            ImGui::TextDisabled( "LMB orbit | wheel zoom | O open | W wireframe | Tab details | Q quit" );
        }
        ImGui::End();
    }

    void OverlayLayer::DrawLoadPrompt()
    {
        if( m_promptRequested )
        {
            ImGui::OpenPopup( LOAD_PROMPT_ID );
            m_promptRequested = false;
        }

        ImGuiViewport* viewport = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos( viewport->GetCenter(), ImGuiCond_Appearing, ImVec2( 0.5f, 0.5f ) );

        if( ImGui::BeginPopupModal( LOAD_PROMPT_ID, nullptr, ImGuiWindowFlags_AlwaysAutoResize ) )
        {
            ImGui::TextUnformatted( "Path to a Wavefront OBJ file:" );
            if( ImGui::IsWindowAppearing() )
            {
                ImGui::SetKeyboardFocusHere();
            }
            ImGui::SetNextItemWidth( 480.0f );
            bool_t confirmed = ImGui::InputText( "##path", m_pathBuffer, sizeof( m_pathBuffer ), ImGuiInputTextFlags_EnterReturnsTrue );

            confirmed = ImGui::Button( "Open" ) || confirmed;
            ImGui::SameLine();
            bool_t cancelled = ImGui::Button( "Cancel" ) || ImGui::IsKeyPressed( ImGuiKey_Escape );

            if( confirmed && m_pathBuffer[ 0 ] != '\0' )
            {
                m_requestedPath = m_pathBuffer;
                m_hasRequest    = true;
                ImGui::CloseCurrentPopup();
            }
            else if( cancelled )
            {
                ImGui::CloseCurrentPopup();
            }
            ImGui::EndPopup();
        }
    }

    void OverlayLayer::Render( CommandBuffer& cmd )
    {
        if( !m_frameOpen )
            return;

        ImGui::Render();
        m_frameOpen = false;

        ImDrawData* drawData = ImGui::GetDrawData();
        if( drawData )
        {
            ImGui_ImplVulkan_RenderDrawData( drawData, cmd.GetHandle() );
        }
    }

    bool_t OverlayLayer::PollLoadRequest( std::string& outPath )
    {
        if( !m_hasRequest )
            return false;
        outPath      = m_requestedPath;
        m_hasRequest = false;
        return true;
    }

    bool_t OverlayLayer::WantsMouse() const
    {
        return ImGui::GetIO().WantCaptureMouse;
    }

    bool_t OverlayLayer::WantsKeyboard() const
    {
        return ImGui::GetIO().WantTextInput;
    }
} // namespace DotObjViewer
