#include "core/FileSystem.hpp"

namespace DotObjViewer
{
    std::filesystem::path FileSystem::s_rootDirectory;

    Result FileSystem::Init()
    {
        if( s_rootDirectory.empty() )
        {
#if defined( DOV_ASSET_DIR )
            s_rootDirectory = std::filesystem::path( DOV_ASSET_DIR );
            DOV_CORE_INFO( "FileSystem: Running in DEV mode. Root: '{}'", s_rootDirectory.string() );
#else
            s_rootDirectory = std::filesystem::current_path() / "assets";
            DOV_CORE_INFO( "FileSystem: Running in RELEASE mode. Root: '{}'", s_rootDirectory.string() );
#endif
        }

        std::error_code ec;
        if( !std::filesystem::exists( s_rootDirectory, ec ) )
        {
            DOV_CORE_CRITICAL( "FileSystem: Assets directory does not exist at: {}", s_rootDirectory.string() );
            return Result::NOT_FOUND;
        }
        return Result::SUCCESS;
    }

    void FileSystem::SetRoot( const std::filesystem::path& root )
    {
        s_rootDirectory = root;
    }

    std::filesystem::path FileSystem::GetPath( const std::string& path )
    {
        return s_rootDirectory / path;
    }

    const std::filesystem::path& FileSystem::GetRoot()
    {
        return s_rootDirectory;
    }

} // namespace DotObjViewer
