#include "resources/ObjParser.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace DotObjViewer;

namespace
{
    std::vector<RawModel> ParseOk( const std::string& text )
    {
        std::vector<RawModel> models;
        std::string           error;
        Result                res = ObjParser::ParseString( text, models, error );
        EXPECT_EQ( res, Result::SUCCESS ) << error;
        return models;
    }

    const char* QUAD = "v 0 0 0\n"
                       "v 1 0 0\n"
                       "v 1 1 0\n"
                       "v 0 1 0\n";
} // namespace

// =================================================================================================
// Faces
// =================================================================================================

TEST( ObjParserTest, ParsesSingleTriangle )
{
    auto models = ParseOk( "v 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 2 3\n" );

    ASSERT_EQ( models.size(), 1u );
    EXPECT_EQ( models[ 0 ].positions.size(), 3u );
    EXPECT_EQ( models[ 0 ].indices, ( std::vector<uint32_t>{ 0, 1, 2 } ) );
    EXPECT_TRUE( models[ 0 ].normals.empty() ) << "No 'vn' data means no normals";
}

TEST( ObjParserTest, QuadIsFanTriangulated )
{
    auto models = ParseOk( std::string( QUAD ) + "f 1 2 3 4\n" );

    ASSERT_EQ( models.size(), 1u );
    EXPECT_EQ( models[ 0 ].indices, ( std::vector<uint32_t>{ 0, 1, 2, 0, 2, 3 } ) );
}

TEST( ObjParserTest, AcceptsAllCornerForms )
{
    const std::string text = std::string( QUAD ) + "vt 0 0\n"
                                                    "vn 0 0 1\n"
                                                    "f 1/1 2/1 3/1\n"
                                                    "f 1//1 3//1 4//1\n"
                                                    "f 2/1/1 3/1/1 4/1/1\n";
    auto models = ParseOk( text );

    ASSERT_EQ( models.size(), 1u );
    EXPECT_EQ( models[ 0 ].indices.size(), 9u );
    ASSERT_EQ( models[ 0 ].normals.size(), models[ 0 ].positions.size() );
}

TEST( ObjParserTest, NegativeIndicesCountFromEnd )
{
    auto models = ParseOk( std::string( QUAD ) + "f -4 -3 -2\n" );

    ASSERT_EQ( models.size(), 1u );
    ASSERT_EQ( models[ 0 ].positions.size(), 3u );
    EXPECT_FLOAT_EQ( models[ 0 ].positions[ 0 ].x, 0.0f );
    EXPECT_FLOAT_EQ( models[ 0 ].positions[ 1 ].x, 1.0f );
    EXPECT_FLOAT_EQ( models[ 0 ].positions[ 2 ].y, 1.0f );
}

TEST( ObjParserTest, SharedCornersAreNotDuplicated )
{
    auto models = ParseOk( std::string( QUAD ) + "f 1 2 3\nf 1 3 4\n" );

    ASSERT_EQ( models.size(), 1u );
    EXPECT_EQ( models[ 0 ].positions.size(), 4u );
    EXPECT_EQ( models[ 0 ].indices, ( std::vector<uint32_t>{ 0, 1, 2, 0, 2, 3 } ) );
}

TEST( ObjParserTest, FirstSuppliedNormalWins )
{
    const std::string text = "v 0 0 0\nv 1 0 0\nv 0 1 0\n"
                             "vn 0 0 1\nvn 1 0 0\n"
                             "f 1//1 2//1 3//1\n"
                             "f 1//2 3//2 2//2\n";
    auto models = ParseOk( text );

    ASSERT_EQ( models.size(), 1u );
    ASSERT_EQ( models[ 0 ].normals.size(), 3u );
    EXPECT_FLOAT_EQ( models[ 0 ].normals[ 0 ].z, 1.0f );
    EXPECT_FLOAT_EQ( models[ 0 ].normals[ 0 ].x, 0.0f );
}

TEST( ObjParserTest, CornersWithoutNormalGetZeroVector )
{
    const std::string text = std::string( QUAD ) + "vn 0 0 1\n"
                                                    "f 1//1 2//1 3//1\n"
                                                    "f 1 3 4\n";
    auto models = ParseOk( text );

    ASSERT_EQ( models.size(), 1u );
    ASSERT_EQ( models[ 0 ].normals.size(), 4u );
    EXPECT_EQ( models[ 0 ].normals[ 3 ], glm::vec3( 0.0f ) );
}

// =================================================================================================
// Objects & Groups
// =================================================================================================

TEST( ObjParserTest, ObjectsAndGroupsSplitModels )
{
    const std::string text = std::string( QUAD ) + "o first\n"
                                                    "f 1 2 3\n"
                                                    "g second\n"
                                                    "f 1 3 4\n";
    auto models = ParseOk( text );

    ASSERT_EQ( models.size(), 2u );
    EXPECT_EQ( models[ 0 ].name, "first" );
    EXPECT_EQ( models[ 1 ].name, "second" );

    // Each model re-indexes the positions it uses
    EXPECT_EQ( models[ 1 ].positions.size(), 3u );
    EXPECT_EQ( models[ 1 ].indices, ( std::vector<uint32_t>{ 0, 1, 2 } ) );
}

TEST( ObjParserTest, EmptyGroupsAreDropped )
{
    auto models = ParseOk( std::string( QUAD ) + "o empty\no full\nf 1 2 3\n" );

    ASSERT_EQ( models.size(), 1u );
    EXPECT_EQ( models[ 0 ].name, "full" );
}

TEST( ObjParserTest, FileWithoutFacesBecomesPointCloud )
{
    auto models = ParseOk( std::string( QUAD ) + "v 2 2 2\n" );

    ASSERT_EQ( models.size(), 1u );
    EXPECT_EQ( models[ 0 ].positions.size(), 5u );
    EXPECT_TRUE( models[ 0 ].indices.empty() );
}

TEST( ObjParserTest, IgnoresCommentsAndUnsupportedStatements )
{
    const std::string text = "# exported\r\n"
                             "mtllib scene.mtl\n"
                             "v 0 0 0 # origin\n"
                             "v 1 0 0 1.0\n"
                             "v 0 1 0\n"
                             "usemtl red\n"
                             "s off\n"
                             "l 1 2\n"
                             "curv 0 1 1 2\n"
                             "f 1 2 3\n";
    auto models = ParseOk( text );

    ASSERT_EQ( models.size(), 1u );
    EXPECT_EQ( models[ 0 ].indices.size(), 3u );
}

// =================================================================================================
// Errors
// =================================================================================================

TEST( ObjParserTest, OutOfRangeIndexReportsLine )
{
    std::vector<RawModel> models;
    std::string           error;

    Result res = ObjParser::ParseString( "v 0 0 0\nv 1 0 0\nf 1 2 3\n", models, error );

    EXPECT_EQ( res, Result::INVALID_DATA );
    EXPECT_NE( error.find( "line 3" ), std::string::npos ) << error;
    EXPECT_TRUE( models.empty() ) << "Output must be untouched on failure";
}

TEST( ObjParserTest, ZeroIndexIsRejected )
{
    std::vector<RawModel> models;
    std::string           error;

    EXPECT_EQ( ObjParser::ParseString( "v 0 0 0\nv 1 0 0\nv 0 1 0\nf 0 1 2\n", models, error ), Result::INVALID_DATA );
}

TEST( ObjParserTest, MalformedNumberIsRejected )
{
    std::vector<RawModel> models;
    std::string           error;

    Result res = ObjParser::ParseString( "v 0 0 0\nv 1 abc 0\n", models, error );

    EXPECT_EQ( res, Result::INVALID_DATA );
    EXPECT_NE( error.find( "line 2" ), std::string::npos ) << error;
}

TEST( ObjParserTest, ShortFaceIsRejected )
{
    std::vector<RawModel> models;
    std::string           error;

    EXPECT_EQ( ObjParser::ParseString( "v 0 0 0\nv 1 0 0\nf 1 2\n", models, error ), Result::INVALID_DATA );
}

TEST( ObjParserTest, EmptyInputHasNoGeometry )
{
    std::vector<RawModel> models;
    std::string           error;

    EXPECT_EQ( ObjParser::ParseString( "# nothing here\n", models, error ), Result::INVALID_DATA );
    EXPECT_FALSE( error.empty() );
}

// =================================================================================================
// Files
// =================================================================================================

TEST( ObjParserTest, MissingFileIsNotFound )
{
    std::vector<RawModel> models;
    std::string           error;

    Result res = ObjParser::Parse( "does/not/exist.obj", models, error );

    EXPECT_EQ( res, Result::NOT_FOUND );
    EXPECT_NE( error.find( "does/not/exist.obj" ), std::string::npos );
}

TEST( ObjParserTest, ParsesFileFromDisk )
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "dov_parser_test.obj";
    {
        std::ofstream out( path );
        out << "v 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 2 3\n";
    }

    std::vector<RawModel> models;
    std::string           error;
    EXPECT_EQ( ObjParser::Parse( path.string(), models, error ), Result::SUCCESS ) << error;
    EXPECT_EQ( models.size(), 1u );

    std::filesystem::remove( path );
}
