#include "renderer/DeviceContext.hpp"
#include "renderer/FrameCompositor.hpp"
#include "renderer/PipelineSet.hpp"
#include "renderer/RenderSettings.hpp"
#include "rhi/Swapchain.hpp"
#include <cstddef>
#include <gtest/gtest.h>

using namespace DotObjViewer;

// =================================================================================================
// Render Settings
// =================================================================================================

TEST( RenderSettingsTest, TogglesAreInvolutions )
{
    RenderSettings settings;
    EXPECT_FALSE( settings.wireframe );
    EXPECT_FALSE( settings.overlayDetail );

    settings.ToggleWireframe();
    settings.ToggleOverlayDetail();
    EXPECT_TRUE( settings.wireframe );
    EXPECT_TRUE( settings.overlayDetail );

    settings.ToggleWireframe();
    settings.ToggleOverlayDetail();
    EXPECT_FALSE( settings.wireframe );
    EXPECT_FALSE( settings.overlayDetail );
}

TEST( RenderSettingsTest, WireframeNeedsDeviceSupport )
{
    EXPECT_TRUE( PipelineSet::ResolveWireframe( true, true ) );
    EXPECT_FALSE( PipelineSet::ResolveWireframe( true, false ) );
    EXPECT_FALSE( PipelineSet::ResolveWireframe( false, true ) );
    EXPECT_FALSE( PipelineSet::ResolveWireframe( false, false ) );
}

TEST( PipelineSetTest, VertexLayoutMatchesVertex )
{
    VertexInputLayout layout = PipelineSet::GetVertexLayout();

    EXPECT_EQ( layout.stride, sizeof( Vertex ) );

    ASSERT_EQ( layout.attributes.size(), 3u );
    for( uint32_t i = 0; i < 3; ++i )
    {
        EXPECT_EQ( layout.attributes[ i ].location, i );
        EXPECT_EQ( layout.attributes[ i ].format, VK_FORMAT_R32G32B32_SFLOAT );
    }
    EXPECT_EQ( layout.attributes[ 0 ].offset, offsetof( Vertex, position ) );
    EXPECT_EQ( layout.attributes[ 1 ].offset, offsetof( Vertex, normal ) );
    EXPECT_EQ( layout.attributes[ 2 ].offset, offsetof( Vertex, color ) );
}

// =================================================================================================
// Surface
// =================================================================================================

TEST( SurfaceConfigTest, NeedsResize )
{
    SurfaceConfig surface;
    surface.width  = 800;
    surface.height = 600;

    EXPECT_FALSE( surface.NeedsResize( 800, 600 ) ) << "Same size is a no-op";
    EXPECT_FALSE( surface.NeedsResize( 0, 600 ) );
    EXPECT_FALSE( surface.NeedsResize( 800, 0 ) );
    EXPECT_TRUE( surface.NeedsResize( 1920, 1080 ) );
}

TEST( SurfaceConfigTest, CheckDoesNotStoreTheSize )
{
    SurfaceConfig surface;
    surface.width  = 800;
    surface.height = 600;

    // A reconfiguration that failed leaves the stored size alone, so the same request is retried
    ASSERT_TRUE( surface.NeedsResize( 1920, 1080 ) );
    EXPECT_EQ( surface.width, 800u );
    EXPECT_EQ( surface.height, 600u );
    EXPECT_TRUE( surface.NeedsResize( 1920, 1080 ) );
}

TEST( SwapchainTest, ClassifiesSurfaceResults )
{
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_SUCCESS ), SurfaceStatus::READY );
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_SUBOPTIMAL_KHR ), SurfaceStatus::SUBOPTIMAL );
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_ERROR_OUT_OF_DATE_KHR ), SurfaceStatus::OUT_OF_DATE );
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_ERROR_SURFACE_LOST_KHR ), SurfaceStatus::LOST );
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_ERROR_OUT_OF_HOST_MEMORY ), SurfaceStatus::OUT_OF_MEMORY );
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_ERROR_OUT_OF_DEVICE_MEMORY ), SurfaceStatus::OUT_OF_MEMORY );
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_TIMEOUT ), SurfaceStatus::FAILED );
    EXPECT_EQ( Swapchain::ToSurfaceStatus( VK_ERROR_DEVICE_LOST ), SurfaceStatus::FAILED );
}

TEST( SwapchainTest, PrefersSrgbFormat )
{
    std::vector<VkSurfaceFormatKHR> formats = { { VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR },
                                                { VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR } };

    EXPECT_EQ( Swapchain::ChooseSurfaceFormat( formats ).format, VK_FORMAT_B8G8R8A8_SRGB );
}

TEST( SwapchainTest, FallsBackToFirstFormat )
{
    std::vector<VkSurfaceFormatKHR> formats = { { VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR },
                                                { VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR } };

    EXPECT_EQ( Swapchain::ChooseSurfaceFormat( formats ).format, VK_FORMAT_R8G8B8A8_UNORM );
    EXPECT_EQ( Swapchain::ChooseSurfaceFormat( {} ).format, VK_FORMAT_UNDEFINED );
}

// =================================================================================================
// Frame Compositor
// =================================================================================================

TEST( FrameCompositorTest, PlaceholderIsOneColoredTriangle )
{
    Mesh mesh = FrameCompositor::CreatePlaceholderMesh();

    ASSERT_EQ( mesh.vertices.size(), 3u );
    EXPECT_EQ( mesh.GetTriangleCount(), 1u );
    EXPECT_EQ( mesh.vertices[ 0 ].color, glm::vec3( 1.0f, 0.0f, 0.0f ) );
    EXPECT_EQ( mesh.vertices[ 1 ].color, glm::vec3( 0.0f, 1.0f, 0.0f ) );
    EXPECT_EQ( mesh.vertices[ 2 ].color, glm::vec3( 0.0f, 0.0f, 1.0f ) );

    // Front face looks down +Z towards the default camera
    const glm::vec3& a = mesh.vertices[ 0 ].position;
    const glm::vec3& b = mesh.vertices[ 1 ].position;
    const glm::vec3& c = mesh.vertices[ 2 ].position;
    EXPECT_GT( glm::cross( b - a, c - a ).z, 0.0f );
}

TEST( FrameCompositorTest, UniformsSnapshotCamera )
{
    Camera camera( glm::radians( 45.0f ), 1.5f, 0.1f, 1000.0f );
    camera.ApplyOrbitDelta( 25.0f, 10.0f );

    FrameUniforms frame = FrameCompositor::BuildFrameUniforms( camera );
    EXPECT_EQ( frame.viewProjection, camera.GetViewProjection() );
    EXPECT_EQ( frame.view, camera.GetView() );
    EXPECT_EQ( glm::vec3( frame.cameraPosition ), camera.GetPosition() );

    LightUniforms light = FrameCompositor::BuildLightUniforms( camera );
    EXPECT_EQ( glm::vec3( light.position ), camera.GetPosition() ) << "Headlight follows the camera";
    EXPECT_GT( light.color.a, 0.0f );
}
