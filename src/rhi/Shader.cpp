#include "rhi/Shader.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <shaderc/shaderc.hpp>
#include <spirv_reflect.h>

namespace DotObjViewer
{
    Shader::Shader( VkDevice device, const VolkDeviceTable* api, const std::string& filepath )
        : m_deviceHandle( device )
        , m_api( api )
        , m_path( std::filesystem::path( filepath ).generic_string() )
    {
        DOV_CORE_ASSERT( m_api, "VolkDeviceTable is null!" );

        std::string source;
        if( ReadFile( filepath, source ) != Result::SUCCESS )
        {
            return;
        }

        m_stage = InferStageFromPath( filepath );
        if( m_stage == VK_SHADER_STAGE_ALL )
        {
            DOV_CORE_ERROR( "Could not infer shader stage from file extension: {}", m_path );
            return;
        }

        std::vector<uint32_t> spirv = CompileOrGetCache( source );
        if( spirv.empty() )
        {
            DOV_CORE_ERROR( "Failed to compile or load shader: {}", m_path );
            return;
        }

        if( Reflect( spirv ) != Result::SUCCESS )
        {
            return;
        }

        VkShaderModuleCreateInfo createInfo = { VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO };
        createInfo.codeSize                 = spirv.size() * sizeof( uint32_t );
        createInfo.pCode                    = spirv.data();

        if( m_api->vkCreateShaderModule( m_deviceHandle, &createInfo, nullptr, &m_module ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create shader module for: {}", m_path );
            m_module = VK_NULL_HANDLE;
        }
    }

    Shader::~Shader()
    {
        if( m_module != VK_NULL_HANDLE && m_api )
        {
            m_api->vkDestroyShaderModule( m_deviceHandle, m_module, nullptr );
        }
    }

    std::vector<uint32_t> Shader::CompileOrGetCache( const std::string& source )
    {
        std::filesystem::path sourcePath( m_path );
        std::filesystem::path cachePath = sourcePath;
        cachePath += ".spv";
        const std::string cacheStr = cachePath.generic_string();

        // Reuse the binary only if it is newer than the source
        std::error_code ec;
        bool            shouldCompile = true;
        if( std::filesystem::exists( cachePath, ec ) )
        {
            auto sourceTime = std::filesystem::last_write_time( sourcePath, ec );
            auto cacheTime  = std::filesystem::last_write_time( cachePath, ec );
            shouldCompile   = ec || sourceTime > cacheTime;
        }

        if( !shouldCompile )
        {
            std::ifstream in( cachePath, std::ios::in | std::ios::binary | std::ios::ate );
            if( in )
            {
                size_t fileSize = static_cast<size_t>( in.tellg() );
                if( fileSize > 0 && fileSize % sizeof( uint32_t ) == 0 )
                {
                    in.seekg( 0, std::ios::beg );
                    std::vector<uint32_t> spirv( fileSize / sizeof( uint32_t ) );
                    in.read( reinterpret_cast<char*>( spirv.data() ), fileSize );
                    DOV_CORE_TRACE( "Loaded shader from cache: {}", cacheStr );
                    return spirv;
                }
            }
            DOV_CORE_WARN( "Shader cache unreadable: {}. Recompiling...", cacheStr );
        }

        DOV_CORE_INFO( "Compiling shader: {}", m_path );

        shaderc::Compiler       compiler;
        shaderc::CompileOptions options;
        options.SetTargetEnvironment( shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_3 );
        options.SetOptimizationLevel( shaderc_optimization_level_performance );
        // Keeps block instance names visible to SPIRV-Reflect
        options.SetGenerateDebugInfo();

        shaderc_shader_kind kind = m_stage == VK_SHADER_STAGE_VERTEX_BIT ? shaderc_glsl_vertex_shader : shaderc_glsl_fragment_shader;

        shaderc::SpvCompilationResult module = compiler.CompileGlslToSpv( source, kind, m_path.c_str(), options );
        if( module.GetCompilationStatus() != shaderc_compilation_status_success )
        {
            DOV_CORE_ERROR( "Shader Compilation Failed ({0}):\n{1}", m_path, module.GetErrorMessage() );
            return {};
        }

        std::vector<uint32_t> spirv( module.cbegin(), module.cend() );

        std::ofstream out( cachePath, std::ios::out | std::ios::binary | std::ios::trunc );
        if( out )
        {
            out.write( reinterpret_cast<const char*>( spirv.data() ), spirv.size() * sizeof( uint32_t ) );
        }
        else
        {
            // Read-only install trees still work, they just compile every run
            DOV_CORE_WARN( "Failed to write shader cache to: {}", cacheStr );
        }

        return spirv;
    }

    Result Shader::Reflect( const std::vector<uint32_t>& spirv )
    {
        SpvReflectShaderModule module;
        if( spvReflectCreateShaderModule( spirv.size() * sizeof( uint32_t ), spirv.data(), &module ) != SPV_REFLECT_RESULT_SUCCESS )
        {
            DOV_CORE_ERROR( "SPIRV-Reflect failed for: {}", m_path );
            return Result::INVALID_DATA;
        }

        uint32_t count = 0;
        spvReflectEnumerateDescriptorSets( &module, &count, nullptr );
        std::vector<SpvReflectDescriptorSet*> sets( count );
        spvReflectEnumerateDescriptorSets( &module, &count, sets.data() );

        for( auto* set: sets )
        {
            for( uint32_t i = 0; i < set->binding_count; ++i )
            {
                auto* binding = set->bindings[ i ];

                ShaderResource resource{};
                resource.set        = binding->set;
                resource.binding    = binding->binding;
                resource.arraySize  = binding->count;
                resource.stageFlags = m_stage;

                if( binding->name && strlen( binding->name ) > 0 )
                {
                    resource.name = binding->name;
                }
                else if( binding->type_description && binding->type_description->type_name &&
                         strlen( binding->type_description->type_name ) > 0 )
                {
                    resource.name = binding->type_description->type_name;
                }
                else
                {
                    resource.name = "Unnamed_S" + std::to_string( binding->set ) + "_B" + std::to_string( binding->binding );
                }

                switch( binding->descriptor_type )
                {
                    case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER:
                        resource.type = ShaderResourceType::UNIFORM_BUFFER;
                        resource.size = binding->block.padded_size;
                        break;
                    case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_BUFFER:
                        resource.type = ShaderResourceType::STORAGE_BUFFER;
                        resource.size = binding->block.padded_size;
                        break;
                    case SPV_REFLECT_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER:
                        resource.type = ShaderResourceType::SAMPLED_IMAGE;
                        break;
                    default:
                        DOV_CORE_WARN( "Unsupported resource type in shader {}: {}", m_path, resource.name );
                        break;
                }

                m_reflectionData[ resource.name ] = resource;
            }
        }

        uint32_t pcCount = 0;
        spvReflectEnumeratePushConstantBlocks( &module, &pcCount, nullptr );
        std::vector<SpvReflectBlockVariable*> pcs( pcCount );
        spvReflectEnumeratePushConstantBlocks( &module, &pcCount, pcs.data() );

        for( auto* pc: pcs )
        {
            VkPushConstantRange range{};
            range.offset     = pc->offset;
            range.size       = pc->size;
            range.stageFlags = m_stage;
            m_pushConstantRanges.push_back( range );
        }

        spvReflectDestroyShaderModule( &module );
        return Result::SUCCESS;
    }

    Result Shader::ReadFile( const std::string& filepath, std::string& outContents )
    {
        std::ifstream in( filepath, std::ios::in | std::ios::binary );
        if( !in )
        {
            DOV_CORE_ERROR( "Could not open shader file: {}", filepath );
            return Result::NOT_FOUND;
        }

        in.seekg( 0, std::ios::end );
        outContents.resize( static_cast<size_t>( in.tellg() ) );
        in.seekg( 0, std::ios::beg );
        in.read( &outContents[ 0 ], outContents.size() );
        return Result::SUCCESS;
    }

    VkShaderStageFlagBits Shader::InferStageFromPath( const std::string& filepath )
    {
        const std::string ext = std::filesystem::path( filepath ).extension().string();
        if( ext == ".vert" )
            return VK_SHADER_STAGE_VERTEX_BIT;
        if( ext == ".frag" )
            return VK_SHADER_STAGE_FRAGMENT_BIT;
        return VK_SHADER_STAGE_ALL;
    }

    void Shader::LogResources() const
    {
        DOV_CORE_TRACE( "--- Shader Reflection: {} ---", m_path );
        for( const auto& [ name, res ]: m_reflectionData )
        {
            const char* typeStr = "Unknown";
            switch( res.type )
            {
                case ShaderResourceType::UNIFORM_BUFFER:
                    typeStr = "UniformBuffer";
                    break;
                case ShaderResourceType::STORAGE_BUFFER:
                    typeStr = "StorageBuffer";
                    break;
                case ShaderResourceType::SAMPLED_IMAGE:
                    typeStr = "SampledImage";
                    break;
                default:
                    break;
            }
            DOV_CORE_TRACE( "  Name: {}, Set: {}, Binding: {}, Type: {}, Size: {}", name, res.set, res.binding, typeStr, res.size );
        }
    }
} // namespace DotObjViewer
