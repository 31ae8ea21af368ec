#include "resources/MeshBuilder.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace DotObjViewer;

namespace
{
    RawModel MakeTriangle()
    {
        RawModel model;
        model.name      = "triangle";
        model.positions = { { 0.0f, 0.0f, 0.0f }, { 1.0f, 0.0f, 0.0f }, { 0.0f, 1.0f, 0.0f } };
        model.indices   = { 0, 1, 2 };
        return model;
    }

    // 8 shared corners, 12 counter-clockwise triangles
    RawModel MakeUnitCube()
    {
        RawModel model;
        model.name      = "cube";
        model.positions = { { -0.5f, -0.5f, -0.5f }, { 0.5f, -0.5f, -0.5f }, { 0.5f, 0.5f, -0.5f }, { -0.5f, 0.5f, -0.5f },
                            { -0.5f, -0.5f, 0.5f },  { 0.5f, -0.5f, 0.5f },  { 0.5f, 0.5f, 0.5f },  { -0.5f, 0.5f, 0.5f } };
        model.indices   = { 4, 5, 6, 4, 6, 7,   // +Z
                            1, 0, 3, 1, 3, 2,   // -Z
                            5, 1, 2, 5, 2, 6,   // +X
                            0, 4, 7, 0, 7, 3,   // -X
                            7, 6, 2, 7, 2, 3,   // +Y
                            0, 1, 5, 0, 5, 4 }; // -Y
        return model;
    }

    void ExpectUnitLength( const glm::vec3& v )
    {
        EXPECT_NEAR( glm::length( v ), 1.0f, 1e-5f );
    }
} // namespace

// =================================================================================================
// Build
// =================================================================================================

TEST( MeshBuilderTest, SuppliedIndicesPassThrough )
{
    Mesh        mesh;
    std::string error;

    ASSERT_EQ( MeshBuilder::Build( { MakeTriangle() }, mesh, error ), Result::SUCCESS ) << error;

    EXPECT_EQ( mesh.vertices.size(), 3u );
    EXPECT_EQ( mesh.indices, ( std::vector<uint32_t>{ 0, 1, 2 } ) );
    EXPECT_EQ( mesh.GetTriangleCount(), 1u );
}

TEST( MeshBuilderTest, VerticesGetDefaultColor )
{
    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { MakeTriangle() }, mesh, error ), Result::SUCCESS );

    for( const Vertex& v : mesh.vertices )
    {
        EXPECT_EQ( v.color, MeshBuilder::DEFAULT_COLOR );
    }
}

TEST( MeshBuilderTest, MissingNormalsAreComputedFromFaces )
{
    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { MakeTriangle() }, mesh, error ), Result::SUCCESS );

    // Counter-clockwise in the XY plane faces +Z
    for( const Vertex& v : mesh.vertices )
    {
        EXPECT_NEAR( v.normal.z, 1.0f, 1e-5f );
    }
}

TEST( MeshBuilderTest, SuppliedNormalsAreKept )
{
    RawModel model = MakeTriangle();
    model.normals  = { { 1.0f, 0.0f, 0.0f }, { 1.0f, 0.0f, 0.0f }, { 0.0f, 0.0f, 0.0f } };

    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::SUCCESS );

    EXPECT_FLOAT_EQ( mesh.vertices[ 0 ].normal.x, 1.0f );
    EXPECT_FLOAT_EQ( mesh.vertices[ 1 ].normal.x, 1.0f );

    // Zero-length normal counts as absent
    EXPECT_NEAR( mesh.vertices[ 2 ].normal.z, 1.0f, 1e-5f );
}

TEST( MeshBuilderTest, MissingIndicesAreSynthesized )
{
    RawModel model;
    model.positions = { { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 }, { 0, 0, 1 }, { 1, 0, 1 }, { 0, 1, 1 } };

    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::SUCCESS );

    EXPECT_EQ( mesh.indices, ( std::vector<uint32_t>{ 0, 1, 2, 3, 4, 5 } ) );
}

TEST( MeshBuilderTest, TrailingVerticesAreKeptButUnreferenced )
{
    RawModel model;
    model.positions = { { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 }, { 5, 5, 5 }, { 6, 6, 6 } };

    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::SUCCESS );

    EXPECT_EQ( mesh.vertices.size(), 5u );
    EXPECT_EQ( mesh.indices.size(), 3u );
    for( uint32_t index : mesh.indices )
    {
        EXPECT_LT( index, 3u );
    }

    // Unreferenced vertices get the fallback normal
    EXPECT_EQ( mesh.vertices[ 3 ].normal, MeshBuilder::FALLBACK_NORMAL );
    EXPECT_EQ( mesh.vertices[ 4 ].normal, MeshBuilder::FALLBACK_NORMAL );
}

TEST( MeshBuilderTest, ModelsAreConcatenatedWithOffsets )
{
    RawModel second = MakeTriangle();
    for( glm::vec3& p : second.positions )
    {
        p += glm::vec3( 0.0f, 0.0f, 2.0f );
    }

    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { MakeTriangle(), second }, mesh, error ), Result::SUCCESS );

    EXPECT_EQ( mesh.vertices.size(), 6u );
    EXPECT_EQ( mesh.indices, ( std::vector<uint32_t>{ 0, 1, 2, 3, 4, 5 } ) );
    EXPECT_FLOAT_EQ( mesh.boundsMax.z, 2.0f );
}

TEST( MeshBuilderTest, UnitCube )
{
    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::Build( { MakeUnitCube() }, mesh, error ), Result::SUCCESS ) << error;

    EXPECT_EQ( mesh.vertices.size(), 8u );
    EXPECT_EQ( mesh.indices.size(), 36u );
    EXPECT_EQ( mesh.boundsMin, glm::vec3( -0.5f ) );
    EXPECT_EQ( mesh.boundsMax, glm::vec3( 0.5f ) );

    // Smooth normals at the corners point diagonally outwards
    for( const Vertex& v : mesh.vertices )
    {
        ExpectUnitLength( v.normal );
        EXPECT_GT( glm::dot( v.normal, v.position ), 0.0f );
    }
}

TEST( MeshBuilderTest, OutOfRangeIndexFails )
{
    RawModel model = MakeTriangle();
    model.indices  = { 0, 1, 3 };

    Mesh mesh;
    mesh.indices = { 42 };
    std::string error;

    EXPECT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::INVALID_DATA );
    EXPECT_FALSE( error.empty() );
    EXPECT_EQ( mesh.indices, ( std::vector<uint32_t>{ 42 } ) ) << "Output must be untouched on failure";
}

TEST( MeshBuilderTest, PartialTriangleIndexListFails )
{
    RawModel model = MakeTriangle();
    model.indices  = { 0, 1 };

    Mesh        mesh;
    std::string error;
    EXPECT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::INVALID_DATA );
}

TEST( MeshBuilderTest, MismatchedNormalCountFails )
{
    RawModel model = MakeTriangle();
    model.normals  = { { 0, 0, 1 } };

    Mesh        mesh;
    std::string error;
    EXPECT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::INVALID_DATA );
}

TEST( MeshBuilderTest, TooFewVerticesForTriangleFails )
{
    RawModel model;
    model.positions = { { 0, 0, 0 }, { 1, 0, 0 } };

    Mesh        mesh;
    std::string error;
    EXPECT_EQ( MeshBuilder::Build( { model }, mesh, error ), Result::INVALID_DATA );
    EXPECT_TRUE( mesh.IsEmpty() );
}

// =================================================================================================
// Helpers
// =================================================================================================

TEST( MeshBuilderTest, SynthesizeIndicesDropsRemainder )
{
    EXPECT_TRUE( MeshBuilder::SynthesizeIndices( 2 ).empty() );
    EXPECT_EQ( MeshBuilder::SynthesizeIndices( 3 ).size(), 3u );
    EXPECT_EQ( MeshBuilder::SynthesizeIndices( 7 ).size(), 6u );
}

TEST( MeshBuilderTest, DegenerateTrianglesContributeNothing )
{
    std::vector<glm::vec3> positions = { { 0, 0, 0 }, { 1, 0, 0 }, { 2, 0, 0 }, { 0, 1, 0 } };

    // First triangle is collinear, second one faces +Z
    auto normals = MeshBuilder::ComputeNormals( positions, { 0, 1, 2, 0, 1, 3 } );

    ASSERT_EQ( normals.size(), 4u );
    EXPECT_NEAR( normals[ 0 ].z, 1.0f, 1e-5f );
    EXPECT_EQ( normals[ 2 ], MeshBuilder::FALLBACK_NORMAL ) << "Only used by a degenerate triangle";
}

TEST( MeshBuilderTest, SharedVertexAveragesFaceNormals )
{
    // Two triangles folded along the X axis at a right angle
    std::vector<glm::vec3> positions = { { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 }, { 0, 0, -1 } };
    auto                   normals   = MeshBuilder::ComputeNormals( positions, { 0, 1, 2, 0, 1, 3 } );

    glm::vec3 expected = glm::normalize( glm::vec3( 0.0f, 1.0f, 1.0f ) );
    EXPECT_NEAR( normals[ 0 ].x, expected.x, 1e-5f );
    EXPECT_NEAR( normals[ 0 ].y, expected.y, 1e-5f );
    EXPECT_NEAR( normals[ 0 ].z, expected.z, 1e-5f );
}

TEST( MeshBuilderTest, LoadFromFileParsesAndBuilds )
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "dov_builder_test.obj";
    {
        std::ofstream out( path );
        out << "v -1 -1 0\nv 1 -1 0\nv 1 1 0\nv -1 1 0\nf 1 2 3 4\n";
    }

    Mesh        mesh;
    std::string error;
    ASSERT_EQ( MeshBuilder::LoadFromFile( path.string(), mesh, error ), Result::SUCCESS ) << error;
    EXPECT_EQ( mesh.GetTriangleCount(), 2u );
    EXPECT_EQ( mesh.boundsMin, glm::vec3( -1.0f, -1.0f, 0.0f ) );

    std::filesystem::remove( path );
}
