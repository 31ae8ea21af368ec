#pragma once
#include "core/Base.hpp"
#include "resources/Mesh.hpp"
#include "rhi/Buffer.hpp"

namespace DotObjViewer
{
    class Device;

    /**
     * @brief GPU copy of a Mesh: one device-local vertex buffer and one index buffer.
     * Upload() is blocking. The previous buffers are released only once the new ones
     * are fully uploaded, so a failed upload keeps the old mesh drawable.
     * The caller must make sure no submitted frame still reads the old buffers.
     */
    class MeshBuffer
    {
    public:
        MeshBuffer() = default;
        ~MeshBuffer() = default;

        MeshBuffer( const MeshBuffer& )            = delete;
        MeshBuffer& operator=( const MeshBuffer& ) = delete;

        Result Upload( Device& device, const Mesh& mesh );
        void   Release();

        bool_t      IsLoaded() const { return m_vertexBuffer != nullptr && m_indexBuffer != nullptr; }
        Ref<Buffer> GetVertexBuffer() const { return m_vertexBuffer; }
        Ref<Buffer> GetIndexBuffer() const { return m_indexBuffer; }
        uint32_t    GetVertexCount() const { return m_vertexCount; }
        uint32_t    GetIndexCount() const { return m_indexCount; }
        uint32_t    GetTriangleCount() const { return m_indexCount / 3; }

    private:
        Ref<Buffer> m_vertexBuffer;
        Ref<Buffer> m_indexBuffer;
        uint32_t    m_vertexCount = 0;
        uint32_t    m_indexCount  = 0;
    };
} // namespace DotObjViewer
