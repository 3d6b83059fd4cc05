#pragma once

#include "gpu_types.hpp"

#include <cstdint>
#include <string_view>

namespace glint
{
enum class BlendFactor : std::uint32_t
{
    Zero = 0,
    One,
    SrcAlpha,
    OneMinusSrcAlpha,
};

enum class BlendOperation : std::uint32_t
{
    Add = 0,
    Subtract,
};

struct BlendComponent
{
    BlendOperation operation = BlendOperation::Add;
    BlendFactor    srcFactor = BlendFactor::One;
    BlendFactor    dstFactor = BlendFactor::Zero;

    bool operator==(const BlendComponent&) const noexcept = default;
};

// Overwrites the target with the fragment output.
inline constexpr BlendComponent BLEND_COMPONENT_REPLACE{
    .operation = BlendOperation::Add,
    .srcFactor = BlendFactor::One,
    .dstFactor = BlendFactor::Zero,
};

enum class PrimitiveTopology : std::uint32_t
{
    PointList = 0,
    LineList,
    LineStrip,
    TriangleList,
    TriangleStrip,
};

enum class FrontFace : std::uint32_t
{
    CCW = 0,
    CW,
};

enum class CullMode : std::uint32_t
{
    None = 0,
    Front,
    Back,
};

enum class PolygonMode : std::uint32_t
{
    Fill = 0,
    Line,
    Point,
};

struct ShaderStageDescriptor
{
    std::string_view source;
    std::string_view entryPoint;
};

struct ColorTargetDescriptor
{
    TextureFormat  format = TextureFormat::Undefined;
    BlendComponent colorBlend = BLEND_COMPONENT_REPLACE;
    BlendComponent alphaBlend = BLEND_COMPONENT_REPLACE;
    // All of red, green, blue and alpha.
    bool           writeAllChannels = true;
};

struct PrimitiveDescriptor
{
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    FrontFace         frontFace = FrontFace::CCW;
    CullMode          cullMode = CullMode::Back;
    PolygonMode       polygonMode = PolygonMode::Fill;
    bool              unclippedDepth = false;
};

struct MultisampleDescriptor
{
    std::uint32_t count = 1;
    std::uint32_t mask = ~0u;
    bool          alphaToCoverageEnabled = false;
};

// The complete state of the renderer's single pipeline. The layout has no bind groups; shaders
// read their inputs from the immediate range only. There is no depth/stencil state, no vertex
// buffers and no pipeline cache.
struct RenderPipelineDescriptor
{
    std::uint32_t         immediateSize = 0;
    ShaderStages          immediateVisibility = ShaderStages::none();
    ShaderStageDescriptor vertex;
    ShaderStageDescriptor fragment;
    ColorTargetDescriptor colorTarget;
    PrimitiveDescriptor   primitive;
    MultisampleDescriptor multisample;
};

inline constexpr std::string_view VERTEX_ENTRY_POINT = "vs_main";
inline constexpr std::string_view FRAGMENT_ENTRY_POINT = "fs_main";

RenderPipelineDescriptor makeRenderPipelineDescriptor(
    TextureFormat    colorFormat,
    std::string_view vertexShaderSource,
    std::string_view fragmentShaderSource);
} // namespace glint
