#include "runtime/AppConfig.hpp"

namespace DotObjViewer
{
    Result ParseCommandLine( int argc, const char* const* argv, AppConfig& outConfig, std::string& outError )
    {
        AppConfig config = outConfig;
        bool_t    hasPath = false;

        for( int i = 1; i < argc; ++i )
        {
            std::string arg = argv[ i ];
            if( arg == "--validation" )
            {
                config.enableValidation = true;
            }
            else if( arg == "--verbose" )
            {
                config.logLevel = spdlog::level::trace;
            }
            else if( arg.size() > 1 && arg[ 0 ] == '-' )
            {
                outError = "unknown option '" + arg + "'";
                return Result::INVALID_ARGS;
            }
            else if( hasPath )
            {
                outError = "only one mesh path may be given";
                return Result::INVALID_ARGS;
            }
            else
            {
                config.initialMeshPath = arg;
                hasPath                = true;
            }
        }

        outConfig = config;
        return Result::SUCCESS;
    }
} // namespace DotObjViewer
