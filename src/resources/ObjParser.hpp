#pragma once
#include "core/Base.hpp"
#include "resources/Mesh.hpp"
#include <string>
#include <vector>

namespace DotObjViewer
{
    /**
     * @brief Minimal Wavefront OBJ reader.
     * Extracts positions, normals and triangle indices per object/group. Texture
     * coordinates, materials and smoothing groups are skipped.
     */
    class ObjParser
    {
    public:
        /**
         * @brief Reads and parses a file.
         * @return Result::NOT_FOUND if the file cannot be opened, Result::INVALID_DATA on malformed content.
         * 'outModels' is only written on success.
         */
        static Result Parse( const std::string& path, std::vector<RawModel>& outModels, std::string& outError );

        // Parses OBJ text already in memory
        static Result ParseString( const std::string& text, std::vector<RawModel>& outModels, std::string& outError );
    };
} // namespace DotObjViewer
