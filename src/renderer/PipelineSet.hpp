#pragma once
#include "core/Base.hpp"
#include "rhi/Pipeline.hpp"
#include <volk.h>

namespace DotObjViewer
{
    class Device;

    /**
     * @brief The two mesh pipelines (solid and wireframe) over one shared layout.
     * Built once at startup. The wireframe pipeline only exists when the device
     * supports non-solid fill modes, otherwise wireframe requests resolve to solid.
     */
    class PipelineSet
    {
    public:
        static constexpr VkFormat DEPTH_FORMAT = VK_FORMAT_D32_SFLOAT;

        PipelineSet( Device& device );
        ~PipelineSet() = default;

        PipelineSet( const PipelineSet& )            = delete;
        PipelineSet& operator=( const PipelineSet& ) = delete;

        /**
         * @brief Compiles both pipelines for the given attachment formats.
         * @return Result::FAIL if the shaders or the solid pipeline cannot be built.
         * A missing wireframe pipeline is reported once and is not an error.
         */
        Result Init( VkFormat colorFormat, VkFormat depthFormat = DEPTH_FORMAT );

        // position@0, normal@1, color@2, tightly packed
        static VertexInputLayout GetVertexLayout();

        // Wireframe is only honored when the device can rasterize lines
        static bool_t ResolveWireframe( bool_t requested, bool_t supported ) { return requested && supported; }

        // Never returns null after a successful Init()
        const Ref<GraphicsPipeline>& Select( bool_t wireframe ) const;

        bool_t                     SupportsWireframe() const { return m_wireframe != nullptr; }
        const Ref<PipelineLayout>& GetLayout() const { return m_layout; }
        const Ref<GraphicsPipeline>& GetSolid() const { return m_solid; }

    private:
        Device&               m_device;
        Ref<PipelineLayout>   m_layout;
        Ref<GraphicsPipeline> m_solid;
        Ref<GraphicsPipeline> m_wireframe;
    };
} // namespace DotObjViewer
