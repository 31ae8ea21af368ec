#include "resources/MeshBuilder.hpp"

#include "resources/ObjParser.hpp"

#include <limits>

namespace DotObjViewer
{
    std::vector<uint32_t> MeshBuilder::SynthesizeIndices( size_t vertexCount )
    {
        std::vector<uint32_t> indices;
        size_t                triangleCount = vertexCount / 3;
        indices.reserve( triangleCount * 3 );
        for( size_t i = 0; i < triangleCount * 3; ++i )
        {
            indices.push_back( static_cast<uint32_t>( i ) );
        }
        return indices;
    }

    std::vector<glm::vec3> MeshBuilder::ComputeNormals( const std::vector<glm::vec3>& positions, const std::vector<uint32_t>& indices )
    {
        // Accumulate per triangle instead of searching triangles per vertex, same sums in O(T)
        std::vector<glm::vec3> accum( positions.size(), glm::vec3( 0.0f ) );

        for( size_t t = 0; t + 2 < indices.size(); t += 3 )
        {
            uint32_t i0 = indices[ t ];
            uint32_t i1 = indices[ t + 1 ];
            uint32_t i2 = indices[ t + 2 ];

            glm::vec3 cross = glm::cross( positions[ i1 ] - positions[ i0 ], positions[ i2 ] - positions[ i0 ] );
            float     len   = glm::length( cross );
            if( len <= std::numeric_limits<float>::epsilon() )
                continue;

            glm::vec3 faceNormal = cross / len;
            accum[ i0 ] += faceNormal;
            accum[ i1 ] += faceNormal;
            accum[ i2 ] += faceNormal;
        }

        for( glm::vec3& n : accum )
        {
            float len = glm::length( n );
            n         = len > std::numeric_limits<float>::epsilon() ? n / len : FALLBACK_NORMAL;
        }
        return accum;
    }

    Result MeshBuilder::Build( const std::vector<RawModel>& models, Mesh& outMesh, std::string& outError )
    {
        Mesh mesh;
        mesh.boundsMin = glm::vec3( std::numeric_limits<float>::max() );
        mesh.boundsMax = glm::vec3( std::numeric_limits<float>::lowest() );

        for( const RawModel& model : models )
        {
            const size_t vertexCount = model.positions.size();
            if( vertexCount == 0 )
                continue;

            if( !model.normals.empty() && model.normals.size() != vertexCount )
            {
                outError = "model '" + model.name + "' has " + std::to_string( model.normals.size() ) + " normals for " +
                           std::to_string( vertexCount ) + " positions";
                return Result::INVALID_DATA;
            }

            std::vector<uint32_t> indices;
            if( model.indices.empty() )
            {
                indices = SynthesizeIndices( vertexCount );
            }
            else
            {
                if( model.indices.size() % 3 != 0 )
                {
                    outError = "model '" + model.name + "' index count " + std::to_string( model.indices.size() ) + " is not a multiple of 3";
                    return Result::INVALID_DATA;
                }
                for( uint32_t index : model.indices )
                {
                    if( index >= vertexCount )
                    {
                        outError = "model '" + model.name + "' references vertex " + std::to_string( index ) + " of " +
                                   std::to_string( vertexCount );
                        return Result::INVALID_DATA;
                    }
                }
                indices = model.indices;
            }

            // Only computed when at least one vertex lacks a usable normal
            std::vector<glm::vec3> computed;
            auto                   hasSupplied = [ & ]( size_t i ) { return !model.normals.empty() && glm::length( model.normals[ i ] ) > 0.0f; };
            for( size_t i = 0; i < vertexCount; ++i )
            {
                if( !hasSupplied( i ) )
                {
                    computed = ComputeNormals( model.positions, indices );
                    break;
                }
            }

            const uint32_t baseVertex = static_cast<uint32_t>( mesh.vertices.size() );
            mesh.vertices.reserve( mesh.vertices.size() + vertexCount );
            for( size_t i = 0; i < vertexCount; ++i )
            {
                Vertex vertex;
                vertex.position = model.positions[ i ];
                vertex.normal   = hasSupplied( i ) ? model.normals[ i ] : computed[ i ];
                vertex.color    = DEFAULT_COLOR;
                mesh.vertices.push_back( vertex );

                mesh.boundsMin = glm::min( mesh.boundsMin, vertex.position );
                mesh.boundsMax = glm::max( mesh.boundsMax, vertex.position );
            }

            mesh.indices.reserve( mesh.indices.size() + indices.size() );
            for( uint32_t index : indices )
            {
                mesh.indices.push_back( baseVertex + index );
            }
        }

        if( mesh.indices.empty() )
        {
            outError = "mesh has no triangles";
            return Result::INVALID_DATA;
        }

        outMesh = std::move( mesh );
        return Result::SUCCESS;
    }

    Result MeshBuilder::LoadFromFile( const std::string& path, Mesh& outMesh, std::string& outError )
    {
        std::vector<RawModel> models;
        Result                res = ObjParser::Parse( path, models, outError );
        if( res != Result::SUCCESS )
        {
            return res;
        }

        res = Build( models, outMesh, outError );
        if( res != Result::SUCCESS )
        {
            outError = path + ": " + outError;
        }
        return res;
    }
} // namespace DotObjViewer
