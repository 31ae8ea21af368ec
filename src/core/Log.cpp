#include "core/Base.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace DotObjViewer
{

    Ref<spdlog::logger> Log::s_coreLogger   = nullptr;
    Ref<spdlog::logger> Log::s_viewerLogger = nullptr;

    void Log::Init( spdlog::level::level_enum level )
    {
        if( s_coreLogger != nullptr )
        {
            return;
        }

        spdlog::set_pattern( "%^[%T] %n: %v%$" );

        s_coreLogger   = spdlog::stdout_color_mt( "CORE" );
        s_viewerLogger = spdlog::stdout_color_mt( "VIEWER" );

        SetLevel( level );

        DOV_CORE_INFO( "Logging system initialized (level: {}).", spdlog::level::to_string_view( level ) );
    }

    void Log::SetLevel( spdlog::level::level_enum level )
    {
        if( s_coreLogger )
            s_coreLogger->set_level( level );
        if( s_viewerLogger )
            s_viewerLogger->set_level( level );
    }

} // namespace DotObjViewer
