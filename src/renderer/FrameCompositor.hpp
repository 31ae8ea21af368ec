#pragma once
#include "core/Base.hpp"
#include "renderer/Camera.hpp"
#include "renderer/DeviceContext.hpp"
#include "renderer/PipelineSet.hpp"
#include "renderer/RenderSettings.hpp"
#include "renderer/Uniforms.hpp"
#include "resources/MeshBuffer.hpp"
#include "rhi/Swapchain.hpp"
#include <glm/glm.hpp>

namespace DotObjViewer
{
    class OverlayLayer;

    /**
     * @brief Records and presents one frame: 3D mesh pass, then the overlay pass.
     *
     * Per call: wait for the previous frame, acquire an image, write the uniforms,
     * draw the mesh (or the placeholder triangle) with depth, composite the overlay
     * with LOAD and no depth, submit once, present.
     * Camera, mesh and pipelines are only read.
     */
    class FrameCompositor
    {
    public:
        static inline const glm::vec4 CLEAR_COLOR = glm::vec4( 0.1f, 0.2f, 0.3f, 1.0f );

        FrameCompositor( DeviceContext& context, const PipelineSet& pipelines );
        ~FrameCompositor() = default;

        FrameCompositor( const FrameCompositor& )            = delete;
        FrameCompositor& operator=( const FrameCompositor& ) = delete;

        // Uploads the placeholder triangle
        Result Init();

        /**
         * @brief Renders and presents one frame.
         * @param mesh The loaded mesh, or nullptr to draw the placeholder triangle.
         * @param overlay Optional overlay recorded after the 3D pass.
         * @return READY/SUBOPTIMAL when presented, otherwise the reason the frame was dropped.
         */
        SurfaceStatus RenderFrame( const Camera& camera, const MeshBuffer* mesh, const RenderSettings& settings, OverlayLayer* overlay );

        // Camera snapshot written to the uniform buffer
        static FrameUniforms BuildFrameUniforms( const Camera& camera );
        // Headlight placed at the camera
        static LightUniforms BuildLightUniforms( const Camera& camera );

        // Red, green and blue corners in the z = 0 plane
        static Mesh CreatePlaceholderMesh();

    private:
        void RecordScenePass( CommandBuffer& cmd, uint32_t imageIndex, const MeshBuffer& mesh, const RenderSettings& settings );
        void RecordOverlayPass( CommandBuffer& cmd, uint32_t imageIndex, OverlayLayer& overlay );

    private:
        DeviceContext&     m_context;
        const PipelineSet& m_pipelines;
        MeshBuffer         m_placeholder;
    };
} // namespace DotObjViewer
