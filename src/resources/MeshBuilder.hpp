#pragma once
#include "core/Base.hpp"
#include "resources/Mesh.hpp"
#include <string>
#include <vector>

namespace DotObjViewer
{
    /**
     * @brief Turns parsed models into one renderable triangle list.
     *
     * - Models are concatenated, their indices offset by the vertices already emitted.
     * - Missing or zero-length normals are replaced by the normalized sum of the face
     *   normals of every triangle using the vertex, or by the fallback up vector.
     * - Models without indices get triangles from consecutive vertex triples. A trailing
     *   1 or 2 vertices stay in the vertex list but are not referenced.
     */
    class MeshBuilder
    {
    public:
        static inline const glm::vec3 DEFAULT_COLOR   = glm::vec3( 0.8f, 0.8f, 0.8f );
        static inline const glm::vec3 FALLBACK_NORMAL = glm::vec3( 0.0f, 1.0f, 0.0f );

        /**
         * @brief Builds 'outMesh' from 'models'.
         * @return Result::INVALID_DATA for out-of-range indices or a mesh without triangles.
         * 'outMesh' is left untouched on failure.
         */
        static Result Build( const std::vector<RawModel>& models, Mesh& outMesh, std::string& outError );

        // Parses an OBJ file and builds it, 'outMesh' is only written on success
        static Result LoadFromFile( const std::string& path, Mesh& outMesh, std::string& outError );

        /**
         * @brief Computes smooth per-vertex normals for a triangle list.
         * Degenerate triangles contribute nothing. Indices must be in range.
         */
        static std::vector<glm::vec3> ComputeNormals( const std::vector<glm::vec3>& positions, const std::vector<uint32_t>& indices );

        // Indices 0..n-1 grouped into consecutive triples, trailing vertices are skipped
        static std::vector<uint32_t> SynthesizeIndices( size_t vertexCount );
    };
} // namespace DotObjViewer
