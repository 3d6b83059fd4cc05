#include "immediate.hpp"
#include "render_pipeline.hpp"

namespace glint
{
RenderPipelineDescriptor makeRenderPipelineDescriptor(
    const TextureFormat    colorFormat,
    const std::string_view vertexShaderSource,
    const std::string_view fragmentShaderSource)
{
    return RenderPipelineDescriptor{
        .immediateSize = static_cast<std::uint32_t>(sizeof(Immediate)),
        .immediateVisibility = ShaderStages{ShaderStage::Vertex, ShaderStage::Fragment},
        .vertex =
            ShaderStageDescriptor{
                .source = vertexShaderSource,
                .entryPoint = VERTEX_ENTRY_POINT,
            },
        .fragment =
            ShaderStageDescriptor{
                .source = fragmentShaderSource,
                .entryPoint = FRAGMENT_ENTRY_POINT,
            },
        .colorTarget =
            ColorTargetDescriptor{
                .format = colorFormat,
                .colorBlend = BLEND_COMPONENT_REPLACE,
                .alphaBlend = BLEND_COMPONENT_REPLACE,
                .writeAllChannels = true,
            },
        // NOTE: the vertex shader emits a single counter-clockwise triangle covering the screen,
        // so back-face culling never discards it.
        .primitive =
            PrimitiveDescriptor{
                .topology = PrimitiveTopology::TriangleList,
                .frontFace = FrontFace::CCW,
                .cullMode = CullMode::Back,
                .polygonMode = PolygonMode::Fill,
                .unclippedDepth = false,
            },
        .multisample =
            MultisampleDescriptor{
                .count = 1,
                .mask = ~0u,
                .alphaToCoverageEnabled = false,
            },
    };
}
} // namespace glint
