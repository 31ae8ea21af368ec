#pragma once
#include <glm/glm.hpp>

namespace DotObjViewer
{
    // Mirrors 'camera' in mesh.vert (std140, set 0 binding 0)
    struct FrameUniforms
    {
        glm::mat4 viewProjection;
        glm::mat4 view;
        glm::vec4 cameraPosition; // xyz = world position, w unused
    };
    static_assert( sizeof( FrameUniforms ) == 144, "FrameUniforms must match the std140 block" );

    // Mirrors 'light' in mesh.frag (std140, set 0 binding 1)
    struct LightUniforms
    {
        glm::vec4 position; // xyz = world position
        glm::vec4 color;    // rgb = color, a = intensity
        float     ambientStrength  = 0.15f;
        float     diffuseStrength  = 0.8f;
        float     specularStrength = 0.3f;
        float     shininess        = 32.0f;
    };
    static_assert( sizeof( LightUniforms ) == 48, "LightUniforms must match the std140 block" );
} // namespace DotObjViewer
