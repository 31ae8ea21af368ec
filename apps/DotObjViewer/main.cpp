#include "core/Log.hpp"
#include "runtime/AppConfig.hpp"
#include "runtime/Application.hpp"
#include <exception>
#include <iostream>

int main( int argc, char** argv )
{
    DotObjViewer::AppConfig config;
    std::string             error;

    for( int i = 1; i < argc; ++i )
    {
        std::string arg = argv[ i ];
        if( arg == "-h" || arg == "--help" )
        {
            std::cout << "Usage: DotObjViewer [--validation] [--verbose] [path/to/model.obj]\n";
            return 0;
        }
    }

    if( DotObjViewer::ParseCommandLine( argc, argv, config, error ) != DotObjViewer::Result::SUCCESS )
    {
        std::cerr << "DotObjViewer: " << error << "\n";
        return 2;
    }

    try
    {
        DotObjViewer::Application app( config );
        if( app.Init() != DotObjViewer::Result::SUCCESS )
        {
            DOV_CRITICAL( "Initialization failed, exiting." );
            return 1;
        }
        return app.Run();
    }
    catch( const std::exception& e )
    {
        std::cerr << "DotObjViewer: fatal error: " << e.what() << "\n";
        return 1;
    }
}
