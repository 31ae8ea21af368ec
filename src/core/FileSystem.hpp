#pragma once
#include "core/Base.hpp"
#include <filesystem>
#include <string>

namespace DotObjViewer
{
    /**
     * @brief Resolves asset paths (shaders) against a single root directory.
     * Development builds point at the source tree, release builds at "<cwd>/assets".
     */
    class FileSystem
    {
    public:
        /**
         * @brief Determines the asset root. Later calls are ignored.
         * @return Result::NOT_FOUND when the root directory does not exist.
         */
        static Result Init();

        /**
         * @brief Overrides the asset root (used by tests and packaged builds).
         */
        static void SetRoot( const std::filesystem::path& root );

        /**
         * @brief Resolves a relative path to a full path under the asset root.
         * @param path The relative path (e.g. "shaders/mesh.vert")
         */
        static std::filesystem::path GetPath( const std::string& path );

        static const std::filesystem::path& GetRoot();

    private:
        static std::filesystem::path s_rootDirectory;
    };
} // namespace DotObjViewer
