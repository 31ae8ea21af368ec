#pragma once
#include "core/Base.hpp"
#include "platform/Window.hpp"
#include <spdlog/common.h>
#include <string>

namespace DotObjViewer
{
    struct AppConfig
    {
        WindowConfig window;

#ifdef DOV_DEBUG
        bool_t enableValidation = true;
#else
        bool_t enableValidation = false;
#endif

        spdlog::level::level_enum logLevel = spdlog::level::info;

        // Loaded once at startup when not empty
        std::string initialMeshPath;
    };

    /**
     * @brief Parses "DotObjViewer [--validation] [--verbose] [path/to/model.obj]".
     * @return Result::INVALID_ARGS on unknown options or more than one path.
     */
    Result ParseCommandLine( int argc, const char* const* argv, AppConfig& outConfig, std::string& outError );
} // namespace DotObjViewer
