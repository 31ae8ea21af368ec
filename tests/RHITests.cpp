#include "core/FileSystem.hpp"
#include "renderer/PipelineSet.hpp"
#include "resources/MeshBuffer.hpp"
#include "resources/MeshBuilder.hpp"
#include "rhi/RHI.hpp"
#include <cstring>
#include <gtest/gtest.h>
#include <vector>

using namespace DotObjViewer;

// =================================================================================================
// Basic RHI Lifecycle Tests
// =================================================================================================

class RHITest : public ::testing::Test
{
protected:
    // Headless so the suite runs without a display
    RHIConfig config;

    void SetUp() override
    {
        if( RHI::IsInitialized() )
            RHI::Shutdown();

        config.enableValidation = false;
        config.headless         = true;
    }

    void TearDown() override
    {
        if( RHI::IsInitialized() )
            RHI::Shutdown();
    }
};

TEST_F( RHITest, InitCreatesValidInstance )
{
    if( RHI::Init( config ) != Result::SUCCESS )
        GTEST_SKIP() << "No Vulkan loader available, skipping.";

    EXPECT_TRUE( RHI::IsInitialized() );
    EXPECT_NE( RHI::GetInstance(), VK_NULL_HANDLE ) << "VkInstance cannot be NULL after initialization";
    EXPECT_TRUE( RHI::IsHeadless() );
}

TEST_F( RHITest, DoubleInitShouldBeIdempotent )
{
    if( RHI::Init( config ) != Result::SUCCESS )
        GTEST_SKIP() << "No Vulkan loader available, skipping.";
    VkInstance inst1 = RHI::GetInstance();

    EXPECT_EQ( RHI::Init( config ), Result::SUCCESS );
    EXPECT_EQ( RHI::GetInstance(), inst1 ) << "Re-calling Init without Shutdown should not create a new instance";
}

TEST_F( RHITest, ShutdownClearsInstance )
{
    if( RHI::Init( config ) != Result::SUCCESS )
        GTEST_SKIP() << "No Vulkan loader available, skipping.";

    RHI::Shutdown();
    EXPECT_FALSE( RHI::IsInitialized() );
    EXPECT_EQ( RHI::GetInstance(), VK_NULL_HANDLE );

    ASSERT_EQ( RHI::Init( config ), Result::SUCCESS );
    EXPECT_NE( RHI::GetInstance(), VK_NULL_HANDLE );
}

TEST_F( RHITest, InvalidAdapterIndexReturnsNull )
{
    if( RHI::Init( config ) != Result::SUCCESS )
        GTEST_SKIP() << "No Vulkan loader available, skipping.";

    EXPECT_EQ( RHI::CreateDevice( RHI::GetAdapterCount() ), nullptr );
}

// =================================================================================================
// Device Tests
// =================================================================================================

class DeviceTest : public ::testing::Test
{
protected:
    Ref<Device> device;
    RHIConfig   config;

    void SetUp() override
    {
        if( RHI::IsInitialized() )
            RHI::Shutdown();

        config.headless         = true;
        config.enableValidation = false;
        if( RHI::Init( config ) != Result::SUCCESS )
            return;

        if( RHI::GetAdapterCount() > 0 )
        {
            device = RHI::CreateDevice( 0 );
        }
    }

    void TearDown() override
    {
        if( device )
        {
            RHI::DestroyDevice( device );
            device.reset();
        }
        if( RHI::IsInitialized() )
            RHI::Shutdown();
    }

    // Copies a device-local buffer into host memory
    std::vector<uint8_t> ReadBack( const Buffer& src )
    {
        std::vector<uint8_t> bytes;

        BufferDesc desc;
        desc.size        = src.GetSize();
        desc.type        = BufferType::READBACK;
        Ref<Buffer> host = device->CreateBuffer( desc );
        if( !host )
            return bytes;

        Result res = device->ImmediateSubmit( [ & ]( CommandBuffer& cmd ) { cmd.CopyBuffer( src, *host, src.GetSize() ); } );
        if( res != Result::SUCCESS )
            return bytes;

        bytes.resize( static_cast<size_t>( src.GetSize() ) );
        if( host->Read( bytes.data(), bytes.size() ) != Result::SUCCESS )
            bytes.clear();
        return bytes;
    }
};

TEST_F( DeviceTest, ShouldCreateDeviceSuccessfully )
{
    if( !device )
        GTEST_SKIP() << "No GPU adapters found, skipping device test.";

    EXPECT_NE( device->GetHandle(), VK_NULL_HANDLE ) << "Logical VkDevice handle is null";
    EXPECT_NE( device->GetPhysicalDevice(), VK_NULL_HANDLE ) << "PhysicalDevice handle is null";
    EXPECT_NE( device->GetAllocator(), VK_NULL_HANDLE ) << "VMA Allocator was not initialized";
    EXPECT_FALSE( device->GetName().empty() );
}

TEST_F( DeviceTest, GraphicsQueueHasTimeline )
{
    if( !device )
        GTEST_SKIP();

    auto queue = device->GetGraphicsQueue();
    ASSERT_NE( queue, nullptr );
    EXPECT_NE( queue->GetHandle(), VK_NULL_HANDLE );
    EXPECT_NE( queue->GetTimelineSemaphore(), VK_NULL_HANDLE );
    EXPECT_EQ( queue->GetLastSubmittedValue(), 0u );
    EXPECT_TRUE( queue->IsValueCompleted( 0 ) );
    EXPECT_FALSE( queue->IsValueCompleted( 1 ) );
}

TEST_F( DeviceTest, HeadlessDeviceHasNoSwapchain )
{
    if( !device )
        GTEST_SKIP();

    SwapchainDesc desc;
    desc.width  = 64;
    desc.height = 64;
    EXPECT_EQ( device->CreateSwapchain( desc ), nullptr );
}

TEST_F( DeviceTest, ImmediateSubmitAdvancesTimeline )
{
    if( !device )
        GTEST_SKIP();

    auto queue = device->GetGraphicsQueue();
    ASSERT_EQ( device->ImmediateSubmit( []( CommandBuffer& ) {} ), Result::SUCCESS );

    EXPECT_EQ( queue->GetLastSubmittedValue(), 1u );
    EXPECT_TRUE( queue->IsValueCompleted( 1 ) );
}

TEST_F( DeviceTest, MemoryBudgetIsReported )
{
    if( !device )
        GTEST_SKIP();

    uint64_t used = 0, budget = 0;
    device->QueryMemoryBudget( used, budget );
    EXPECT_GT( budget, 0u );
}

// =================================================================================================
// Buffers & Textures
// =================================================================================================

TEST_F( DeviceTest, UploadBufferIsHostWritable )
{
    if( !device )
        GTEST_SKIP();

    BufferDesc desc;
    desc.size          = 256;
    desc.type          = BufferType::UPLOAD;
    Ref<Buffer> buffer = device->CreateBuffer( desc );
    ASSERT_NE( buffer, nullptr );
    EXPECT_TRUE( buffer->IsHostVisible() );
    EXPECT_EQ( buffer->GetType(), BufferType::UPLOAD );
    EXPECT_EQ( buffer->GetSize(), 256u );

    std::vector<uint32_t> data( 64 );
    for( uint32_t i = 0; i < 64; ++i )
        data[ i ] = i * 3;
    ASSERT_EQ( buffer->Write( data.data(), data.size() * sizeof( uint32_t ) ), Result::SUCCESS );
    EXPECT_EQ( buffer->Write( data.data(), 16, 250 ), Result::INVALID_ARGS ) << "Writes past the end are rejected";

    BufferDesc vdesc;
    vdesc.size          = 256;
    vdesc.type         = BufferType::VERTEX;
    Ref<Buffer> vertex = device->CreateBuffer( vdesc );
    ASSERT_NE( vertex, nullptr );
    EXPECT_FALSE( vertex->IsHostVisible() );
    EXPECT_EQ( vertex->Write( data.data(), 16 ), Result::INVALID_ARGS );
    ASSERT_EQ( device->ImmediateSubmit( [ & ]( CommandBuffer& cmd ) { cmd.CopyBuffer( *buffer, *vertex, 256 ); } ), Result::SUCCESS );

    std::vector<uint8_t> bytes = ReadBack( *vertex );
    ASSERT_EQ( bytes.size(), 256u );
    EXPECT_EQ( std::memcmp( bytes.data(), data.data(), 256 ), 0 );
}

TEST_F( DeviceTest, DepthTextureCreation )
{
    if( !device )
        GTEST_SKIP();

    TextureDesc desc;
    desc.width         = 128;
    desc.height        = 64;
    desc.format        = PipelineSet::DEPTH_FORMAT;
    desc.usage         = TextureUsage::DEPTH_ATTACHMENT;
    Ref<Texture> depth = device->CreateTexture( desc );

    ASSERT_NE( depth, nullptr );
    EXPECT_NE( depth->GetImage(), VK_NULL_HANDLE );
    EXPECT_NE( depth->GetView(), VK_NULL_HANDLE );
    EXPECT_EQ( depth->GetExtent().width, 128u );
    EXPECT_EQ( depth->GetAspect(), static_cast<VkImageAspectFlags>( VK_IMAGE_ASPECT_DEPTH_BIT ) );

    desc.usage = TextureUsage::COLOR_ATTACHMENT;
    EXPECT_EQ( device->CreateTexture( desc ), nullptr ) << "Depth format cannot back a color attachment";
}

// =================================================================================================
// Mesh Upload
// =================================================================================================

TEST_F( DeviceTest, MeshUploadRoundTrip )
{
    if( !device )
        GTEST_SKIP();

    RawModel model;
    model.positions = { { -1, -1, 0 }, { 1, -1, 0 }, { 1, 1, 0 }, { -1, 1, 0 } };
    model.indices   = { 0, 1, 2, 0, 2, 3 };

    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::SUCCESS ) << error;

    MeshBuffer buffer;
    EXPECT_FALSE( buffer.IsLoaded() );
    ASSERT_EQ( buffer.Upload( *device, mesh ), Result::SUCCESS );

    EXPECT_TRUE( buffer.IsLoaded() );
    EXPECT_EQ( buffer.GetVertexCount(), 4u );
    EXPECT_EQ( buffer.GetIndexCount(), 6u );
    EXPECT_EQ( buffer.GetTriangleCount(), 2u );

    std::vector<uint8_t> indexBytes = ReadBack( *buffer.GetIndexBuffer() );
    ASSERT_EQ( indexBytes.size(), mesh.indices.size() * sizeof( uint32_t ) );
    EXPECT_EQ( std::memcmp( indexBytes.data(), mesh.indices.data(), indexBytes.size() ), 0 );

    std::vector<uint8_t> vertexBytes = ReadBack( *buffer.GetVertexBuffer() );
    ASSERT_EQ( vertexBytes.size(), mesh.vertices.size() * sizeof( Vertex ) );
    EXPECT_EQ( std::memcmp( vertexBytes.data(), mesh.vertices.data(), vertexBytes.size() ), 0 );

    buffer.Release();
    EXPECT_FALSE( buffer.IsLoaded() );
    EXPECT_EQ( buffer.GetIndexCount(), 0u );
}

TEST_F( DeviceTest, EmptyMeshUploadKeepsPreviousBuffers )
{
    if( !device )
        GTEST_SKIP();

    RawModel model;
    model.positions = { { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 } };

    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::SUCCESS ) << error;

    MeshBuffer buffer;
    ASSERT_EQ( buffer.Upload( *device, mesh ), Result::SUCCESS );
    Ref<Buffer> vertices = buffer.GetVertexBuffer();

    EXPECT_EQ( buffer.Upload( *device, Mesh() ), Result::INVALID_ARGS );
    EXPECT_TRUE( buffer.IsLoaded() );
    EXPECT_EQ( buffer.GetVertexBuffer(), vertices );
    EXPECT_EQ( buffer.GetTriangleCount(), 1u );
}

// =================================================================================================
// Pipelines
// =================================================================================================

TEST_F( DeviceTest, PipelineSetBuildsSolidPipeline )
{
    if( !device )
        GTEST_SKIP();

    FileSystem::SetRoot( DOV_ASSET_DIR );

    PipelineSet pipelines( *device );
    ASSERT_EQ( pipelines.Init( VK_FORMAT_B8G8R8A8_SRGB ), Result::SUCCESS );

    ASSERT_NE( pipelines.GetSolid(), nullptr );
    ASSERT_NE( pipelines.GetLayout(), nullptr );
    EXPECT_EQ( pipelines.Select( false ), pipelines.GetSolid() );
    EXPECT_EQ( pipelines.GetSolid()->GetPolygonMode(), VK_POLYGON_MODE_FILL );

    // Both pipelines share the camera/light layout
    const ShaderReflectionData& reflection = pipelines.GetLayout()->GetReflectionData();
    ASSERT_EQ( reflection.count( "camera" ), 1u );
    EXPECT_EQ( reflection.at( "camera" ).binding, 0u );
    EXPECT_EQ( reflection.at( "camera" ).stageFlags, static_cast<VkShaderStageFlags>( VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT ) );
    ASSERT_EQ( reflection.count( "light" ), 1u );
    EXPECT_EQ( reflection.at( "light" ).binding, 1u );

    EXPECT_EQ( pipelines.SupportsWireframe(), device->GetFeatures().fillModeNonSolid );
    if( pipelines.SupportsWireframe() )
    {
        EXPECT_EQ( pipelines.Select( true )->GetPolygonMode(), VK_POLYGON_MODE_LINE );
    }
    else
    {
        EXPECT_EQ( pipelines.Select( true ), pipelines.GetSolid() ) << "Wireframe falls back to solid";
    }
}
