#include "resources/ObjParser.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace DotObjViewer
{
    namespace
    {
        // Positions are shared by the whole file, each model re-indexes the ones it uses
        struct ModelBuilder
        {
            RawModel                               model;
            std::vector<bool>                      hasNormal;
            std::unordered_map<uint32_t, uint32_t> remap; // file position index -> local index

            bool HasFaces() const { return !model.indices.empty(); }
        };

        std::vector<std::string> Tokenize( const std::string& line )
        {
            std::vector<std::string> tokens;
            std::istringstream       stream( line );
            std::string              token;
            while( stream >> token )
            {
                tokens.push_back( token );
            }
            return tokens;
        }

        bool ParseFloat( const std::string& token, float& out )
        {
            if( token.empty() )
                return false;
            char* end = nullptr;
            errno     = 0;
            out       = std::strtof( token.c_str(), &end );
            return errno == 0 && end == token.c_str() + token.size();
        }

        bool ParseInt( const std::string& token, long& out )
        {
            if( token.empty() )
                return false;
            char* end = nullptr;
            errno     = 0;
            out       = std::strtol( token.c_str(), &end, 10 );
            return errno == 0 && end == token.c_str() + token.size();
        }

        // OBJ indices are 1-based, negative values count back from the last element read so far
        bool ResolveIndex( long index, size_t count, uint32_t& out )
        {
            long resolved = index > 0 ? index - 1 : static_cast<long>( count ) + index;
            if( index == 0 || resolved < 0 || resolved >= static_cast<long>( count ) )
                return false;
            out = static_cast<uint32_t>( resolved );
            return true;
        }

        std::string LineError( size_t lineNumber, const std::string& what )
        {
            return "line " + std::to_string( lineNumber ) + ": " + what;
        }
    } // namespace

    Result ObjParser::Parse( const std::string& path, std::vector<RawModel>& outModels, std::string& outError )
    {
        std::ifstream file( path, std::ios::in | std::ios::binary );
        if( !file.is_open() )
        {
            outError = "cannot open '" + path + "'";
            return Result::NOT_FOUND;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if( file.bad() )
        {
            outError = "failed to read '" + path + "'";
            return Result::FAIL;
        }

        Result result = ParseString( buffer.str(), outModels, outError );
        if( result != Result::SUCCESS )
        {
            outError = path + ": " + outError;
        }
        return result;
    }

    Result ObjParser::ParseString( const std::string& text, std::vector<RawModel>& outModels, std::string& outError )
    {
        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> normals;
        std::vector<RawModel>  models;

        ModelBuilder current;
        current.model.name = "default";

        auto finishModel = [ & ]() {
            if( current.HasFaces() )
            {
                // Vertices without a supplied normal keep a zero vector, which the builder treats as absent
                bool anyNormal = false;
                for( bool has : current.hasNormal )
                {
                    anyNormal = anyNormal || has;
                }
                if( !anyNormal )
                {
                    current.model.normals.clear();
                }
                models.push_back( std::move( current.model ) );
            }
            current = ModelBuilder();
        };

        std::istringstream stream( text );
        std::string        line;
        size_t             lineNumber = 0;

        while( std::getline( stream, line ) )
        {
            ++lineNumber;
            if( !line.empty() && line.back() == '\r' )
            {
                line.pop_back();
            }

            size_t comment = line.find( '#' );
            if( comment != std::string::npos )
            {
                line.erase( comment );
            }

            std::vector<std::string> tokens = Tokenize( line );
            if( tokens.empty() )
                continue;

            const std::string& keyword = tokens[ 0 ];

            if( keyword == "v" || keyword == "vn" )
            {
                // 'v' may carry an optional w or vertex colors after xyz, only xyz is read
                if( tokens.size() < 4 )
                {
                    outError = LineError( lineNumber, "'" + keyword + "' needs three coordinates" );
                    return Result::INVALID_DATA;
                }
                glm::vec3 value;
                for( int i = 0; i < 3; ++i )
                {
                    if( !ParseFloat( tokens[ i + 1 ], value[ i ] ) )
                    {
                        outError = LineError( lineNumber, "malformed number '" + tokens[ i + 1 ] + "'" );
                        return Result::INVALID_DATA;
                    }
                }
                ( keyword == "v" ? positions : normals ).push_back( value );
            }
            else if( keyword == "f" )
            {
                if( tokens.size() < 4 )
                {
                    outError = LineError( lineNumber, "face needs at least three corners" );
                    return Result::INVALID_DATA;
                }

                std::vector<uint32_t> corners;
                corners.reserve( tokens.size() - 1 );

                for( size_t i = 1; i < tokens.size(); ++i )
                {
                    const std::string& corner = tokens[ i ];

                    // v, v/t, v//n or v/t/n
                    size_t      firstSlash  = corner.find( '/' );
                    std::string posToken    = corner.substr( 0, firstSlash );
                    std::string normalToken;
                    if( firstSlash != std::string::npos )
                    {
                        size_t secondSlash = corner.find( '/', firstSlash + 1 );
                        if( secondSlash != std::string::npos )
                        {
                            normalToken = corner.substr( secondSlash + 1 );
                        }
                    }

                    long     rawPos  = 0;
                    uint32_t fileIdx = 0;
                    if( !ParseInt( posToken, rawPos ) )
                    {
                        outError = LineError( lineNumber, "malformed face corner '" + corner + "'" );
                        return Result::INVALID_DATA;
                    }
                    if( !ResolveIndex( rawPos, positions.size(), fileIdx ) )
                    {
                        outError = LineError( lineNumber, "vertex index " + posToken + " out of range" );
                        return Result::INVALID_DATA;
                    }

                    auto     it = current.remap.find( fileIdx );
                    uint32_t local;
                    if( it == current.remap.end() )
                    {
                        local = static_cast<uint32_t>( current.model.positions.size() );
                        current.remap.emplace( fileIdx, local );
                        current.model.positions.push_back( positions[ fileIdx ] );
                        current.model.normals.push_back( glm::vec3( 0.0f ) );
                        current.hasNormal.push_back( false );
                    }
                    else
                    {
                        local = it->second;
                    }

                    if( !normalToken.empty() )
                    {
                        long     rawNormal = 0;
                        uint32_t normalIdx = 0;
                        if( !ParseInt( normalToken, rawNormal ) )
                        {
                            outError = LineError( lineNumber, "malformed face corner '" + corner + "'" );
                            return Result::INVALID_DATA;
                        }
                        if( !ResolveIndex( rawNormal, normals.size(), normalIdx ) )
                        {
                            outError = LineError( lineNumber, "normal index " + normalToken + " out of range" );
                            return Result::INVALID_DATA;
                        }
                        // First corner that names a normal wins
                        if( !current.hasNormal[ local ] )
                        {
                            current.model.normals[ local ] = normals[ normalIdx ];
                            current.hasNormal[ local ]     = true;
                        }
                    }

                    corners.push_back( local );
                }

                // Fan triangulation keeps the corner winding
                for( size_t i = 1; i + 1 < corners.size(); ++i )
                {
                    current.model.indices.push_back( corners[ 0 ] );
                    current.model.indices.push_back( corners[ i ] );
                    current.model.indices.push_back( corners[ i + 1 ] );
                }
            }
            else if( keyword == "o" || keyword == "g" )
            {
                finishModel();
                current.model.name = tokens.size() > 1 ? tokens[ 1 ] : "default";
            }
            else if( keyword == "vt" || keyword == "vp" || keyword == "mtllib" || keyword == "usemtl" || keyword == "s" || keyword == "l" ||
                     keyword == "p" )
            {
                continue;
            }
            else
            {
                DOV_CORE_TRACE( "OBJ line {}: skipping unknown statement '{}'", lineNumber, keyword );
            }
        }

        std::string pendingName = current.model.name;
        finishModel();

        if( models.empty() )
        {
            if( positions.empty() )
            {
                outError = "no geometry found";
                return Result::INVALID_DATA;
            }

            // Point cloud without faces, triangles are synthesized later from consecutive triples
            RawModel cloud;
            cloud.name      = pendingName;
            cloud.positions = positions;
            if( normals.size() == positions.size() )
            {
                cloud.normals = normals;
            }
            models.push_back( std::move( cloud ) );
        }

        outModels = std::move( models );
        return Result::SUCCESS;
    }
} // namespace DotObjViewer
