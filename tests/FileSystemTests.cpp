#include "core/FileSystem.hpp"
#include <filesystem>
#include <gtest/gtest.h>

using namespace DotObjViewer;

class FileSystemTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_previousRoot = FileSystem::GetRoot();

        m_tempRoot = std::filesystem::temp_directory_path() / "dov_fs_test";
        std::filesystem::remove_all( m_tempRoot );
        std::filesystem::create_directories( m_tempRoot / "shaders" );
    }

    void TearDown() override
    {
        FileSystem::SetRoot( m_previousRoot );
        std::filesystem::remove_all( m_tempRoot );
    }

    std::filesystem::path m_previousRoot;
    std::filesystem::path m_tempRoot;
};

TEST_F( FileSystemTest, ResolvesRelativeToRoot )
{
    FileSystem::SetRoot( m_tempRoot );

    EXPECT_EQ( FileSystem::GetRoot(), m_tempRoot );
    EXPECT_EQ( FileSystem::GetPath( "shaders/mesh.vert" ), m_tempRoot / "shaders" / "mesh.vert" );
}

TEST_F( FileSystemTest, InitKeepsExistingRoot )
{
    FileSystem::SetRoot( m_tempRoot );

    EXPECT_EQ( FileSystem::Init(), Result::SUCCESS );
    EXPECT_EQ( FileSystem::GetRoot(), m_tempRoot );
}

TEST_F( FileSystemTest, InitFailsForMissingRoot )
{
    FileSystem::SetRoot( m_tempRoot / "missing" );

    EXPECT_EQ( FileSystem::Init(), Result::NOT_FOUND );
}

TEST_F( FileSystemTest, BundledShadersExist )
{
    FileSystem::SetRoot( DOV_ASSET_DIR );

    EXPECT_TRUE( std::filesystem::exists( FileSystem::GetPath( "shaders/mesh.vert" ) ) );
    EXPECT_TRUE( std::filesystem::exists( FileSystem::GetPath( "shaders/mesh.frag" ) ) );
}
