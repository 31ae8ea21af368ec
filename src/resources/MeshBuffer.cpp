#include "resources/MeshBuffer.hpp"

#include "rhi/Device.hpp"

namespace DotObjViewer
{
    Result MeshBuffer::Upload( Device& device, const Mesh& mesh )
    {
        if( mesh.vertices.empty() || mesh.indices.empty() )
        {
            DOV_CORE_ERROR( "Cannot upload an empty mesh." );
            return Result::INVALID_ARGS;
        }

        const VkDeviceSize vertexBytes = mesh.vertices.size() * sizeof( Vertex );
        const VkDeviceSize indexBytes  = mesh.indices.size() * sizeof( uint32_t );

        Ref<Buffer> vertexBuffer = device.CreateBuffer( { vertexBytes, BufferType::VERTEX } );
        Ref<Buffer> indexBuffer  = device.CreateBuffer( { indexBytes, BufferType::INDEX } );
        if( !vertexBuffer || !indexBuffer )
        {
            return Result::OUT_OF_MEMORY;
        }

        // Layout: [Vertices... | Indices...]
        Ref<Buffer> staging = device.CreateBuffer( { vertexBytes + indexBytes, BufferType::UPLOAD } );
        if( !staging )
        {
            return Result::OUT_OF_MEMORY;
        }
        Result res = staging->Write( mesh.vertices.data(), vertexBytes, 0 );
        if( res == Result::SUCCESS )
            res = staging->Write( mesh.indices.data(), indexBytes, vertexBytes );
        if( res != Result::SUCCESS )
            return res;

        res = device.ImmediateSubmit( [ & ]( CommandBuffer& cmd ) {
            cmd.CopyBuffer( *staging, *vertexBuffer, vertexBytes, 0, 0 );
            cmd.CopyBuffer( *staging, *indexBuffer, indexBytes, vertexBytes, 0 );

            VkMemoryBarrier barrier = { VK_STRUCTURE_TYPE_MEMORY_BARRIER };
            barrier.srcAccessMask   = VK_ACCESS_TRANSFER_WRITE_BIT;
            barrier.dstAccessMask   = VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT | VK_ACCESS_INDEX_READ_BIT;
            cmd.PipelineBarrier( VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_VERTEX_INPUT_BIT, 0, { barrier }, {}, {} );
        } );
        if( res != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Mesh upload failed: {}", toString( res ) );
            return res;
        }

        m_vertexBuffer = vertexBuffer;
        m_indexBuffer  = indexBuffer;
        m_vertexCount  = static_cast<uint32_t>( mesh.vertices.size() );
        m_indexCount   = static_cast<uint32_t>( mesh.indices.size() );

        DOV_CORE_INFO( "Uploaded mesh: {} vertices, {} triangles ({:.2f} KB)", m_vertexCount, GetTriangleCount(),
                       ( vertexBytes + indexBytes ) / 1024.0 );
        return Result::SUCCESS;
    }

    void MeshBuffer::Release()
    {
        m_vertexBuffer.reset();
        m_indexBuffer.reset();
        m_vertexCount = 0;
        m_indexCount  = 0;
    }
} // namespace DotObjViewer
