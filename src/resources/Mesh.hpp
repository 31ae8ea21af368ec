#pragma once
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace DotObjViewer
{
    /**
     * @brief Interleaved vertex as read by the mesh pipelines.
     * Tightly packed: position @0, normal @1, color @2.
     */
    struct Vertex
    {
        glm::vec3 position;
        glm::vec3 normal;
        glm::vec3 color;
    };
    static_assert( sizeof( Vertex ) == 9 * sizeof( float ), "Vertex must stay tightly packed" );

    /**
     * @brief Geometry of one OBJ object or group before mesh building.
     * 'normals' is either empty or holds one entry per position.
     */
    struct RawModel
    {
        std::string            name;
        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> normals;
        std::vector<uint32_t>  indices; // Triangle list, may be empty
    };

    /**
     * @brief CPU-side triangle list ready for upload.
     * indices.size() is a multiple of 3 and every index is < vertices.size().
     */
    struct Mesh
    {
        std::vector<Vertex>   vertices;
        std::vector<uint32_t> indices;
        glm::vec3             boundsMin = glm::vec3( 0.0f );
        glm::vec3             boundsMax = glm::vec3( 0.0f );

        uint32_t GetTriangleCount() const { return static_cast<uint32_t>( indices.size() / 3 ); }
        bool     IsEmpty() const { return indices.empty(); }
    };
} // namespace DotObjViewer
