// Copyright (C) 2020-2024 Sami Väisänen
// Copyright (C) 2020-2024 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "config.h"

#include "warnpush.h"
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <string>
#include <vector>

#include "base/test_minimal.h"
#include "base/test_float.h"
#include "base/utility.h"
#include "swarm/shader_anchor.h"
#include "swarm/shader_source.h"
#include "swarm/billboard_shader.h"
#include "swarm/unit_test/test_device.h"

namespace {
swarm::BillboardShader::Params MakeParams()
{
    swarm::BillboardShader::Params params;
    params.material = swarm::BillboardShader::Material::Basic;
    params.uniforms.push_back({"uAlpha", swarm::UniformType::Float, 0.5f});
    params.uniforms.push_back({"uTexture", swarm::UniformType::Sampler2D, static_cast<const swarm::Texture*>(nullptr)});
    params.attributes.push_back({"aOffset", swarm::BillboardShader::AttributeType::Vec3});
    params.varyings.push_back({"tint", swarm::BillboardShader::VaryingType::Vec2});
    params.billboard_code = "modelPosition = aOffset;\nlocalTransform = mat2(1.0);\ntint = vec2(uAlpha);";
    params.color_code = "return vec4(tint, 0.0, 1.0);";
    return params;
}
} // namespace

void unit_test_anchor_line()
{
    TEST_CASE(test::Type::Feature)

    std::string name;
    TEST_REQUIRE(swarm::IsAnchorLine("// $FOO", &name));
    TEST_REQUIRE(name == "FOO");
    TEST_REQUIRE(swarm::IsAnchorLine("    // $CALL_GET_2   ", &name));
    TEST_REQUIRE(name == "CALL_GET_2");
    TEST_REQUIRE(swarm::IsAnchorLine("// $FOO") == true);

    TEST_REQUIRE(swarm::IsAnchorLine("// $foo") == false);
    TEST_REQUIRE(swarm::IsAnchorLine("// $") == false);
    TEST_REQUIRE(swarm::IsAnchorLine("//$FOO") == false);
    TEST_REQUIRE(swarm::IsAnchorLine("// $FOO bar") == false);
    TEST_REQUIRE(swarm::IsAnchorLine("x = 1; // $FOO") == false);
    TEST_REQUIRE(swarm::IsAnchorLine("// FOO") == false);
    TEST_REQUIRE(swarm::IsAnchorLine("") == false);

    const auto& anchors = swarm::FindAnchors("a\n// $ONE\nb\n  // $TWO\n// $lower\n");
    TEST_REQUIRE(anchors.size() == 2);
    TEST_REQUIRE(anchors[0] == "ONE");
    TEST_REQUIRE(anchors[1] == "TWO");
}

void unit_test_anchor_substitution()
{
    TEST_CASE(test::Type::Feature)

    const std::string skeleton =
        "first\n"
        "// $A\n"
        "middle\n"
        "    // $B\n"
        "last\n";

    // success
    {
        const auto& ret = swarm::SubstituteAnchors(skeleton, {
            {"A", "alpha"},
            {"B", "beta\n"}
        }, "test");
        TEST_REQUIRE(ret == "first\nalpha\nmiddle\nbeta\nlast\n");
    }

    // inserted text is not scanned again for anchors.
    {
        const auto& ret = swarm::SubstituteAnchors(skeleton, {
            {"A", "// $B"},
            {"B", "// $A"}
        }, "test");
        TEST_REQUIRE(ret == "first\n// $B\nmiddle\n// $A\nlast\n");
    }

    // empty substitution removes the anchor line.
    {
        const auto& ret = swarm::SubstituteAnchors(skeleton, {
            {"A", ""},
            {"B", ""}
        }, "test");
        TEST_REQUIRE(ret == "first\nmiddle\nlast\n");
    }

    // substitution for an anchor that doesn't exist
    TEST_EXCEPTION(swarm::SubstituteAnchors(skeleton, {
        {"A", "alpha"},
        {"B", "beta"},
        {"C", "gamma"}
    }, "test"));

    // anchor without a substitution
    TEST_EXCEPTION(swarm::SubstituteAnchors(skeleton, {
        {"A", "alpha"}
    }, "test"));

    // duplicate substitution
    TEST_EXCEPTION(swarm::SubstituteAnchors(skeleton, {
        {"A", "alpha"},
        {"A", "alpha"},
        {"B", "beta"}
    }, "test"));

    // duplicate anchor in the skeleton
    TEST_EXCEPTION(swarm::SubstituteAnchors("// $A\n// $A\n", {
        {"A", "alpha"}
    }, "test"));

    // check the error message
    try
    {
        swarm::SubstituteAnchors(skeleton, {{"A", "alpha"}}, "my shader");
        TEST_REQUIRE(!"Exception was expected");
    }
    catch (const std::exception& e)
    {
        const std::string what = e.what();
        TEST_REQUIRE(base::Contains(what, "'B'"));
        TEST_REQUIRE(base::Contains(what, "my shader"));
    }
}

void unit_test_shader_source()
{
    TEST_CASE(test::Type::Feature)

    using Source = swarm::ShaderSource;

    TEST_REQUIRE(Source::IsValidIdentifier("foo"));
    TEST_REQUIRE(Source::IsValidIdentifier("_foo1"));
    TEST_REQUIRE(Source::IsValidIdentifier("uPreviousState_positions"));
    TEST_REQUIRE(Source::IsValidIdentifier("") == false);
    TEST_REQUIRE(Source::IsValidIdentifier("1foo") == false);
    TEST_REQUIRE(Source::IsValidIdentifier("foo bar") == false);
    TEST_REQUIRE(Source::IsValidIdentifier("foo-bar") == false);
    TEST_REQUIRE(Source::IsValidIdentifier("gl_Position") == false);
    TEST_REQUIRE(Source::IsValidIdentifier("foo__bar") == false);
    TEST_REQUIRE(Source::IsValidIdentifier("float") == false);
    TEST_REQUIRE(Source::IsValidIdentifier("sampler2D") == false);

    TEST_REQUIRE(Source::ToConst(1.0f) == "1.000000");
    TEST_REQUIRE(Source::ToConst(glm::vec2(1.0f, 0.5f)) == "vec2(1.000000,0.500000)");
    TEST_REQUIRE(Source::ToConst(glm::vec3(0.0f, 1.0f, 0.0f)) == "vec3(0.000000,1.000000,0.000000)");

    Source source(Source::Type::Fragment, Source::Version::GLSL_300, Source::Precision::High);
    source.AddUniform("kColor", Source::UniformType::Vec4f);
    source.AddVarying("vUv", Source::VaryingType::Vec2f);
    source.AddOutput("out_fragColor0", 0);
    source.AddOutput("out_fragColor1", 1);
    source.AddSource("void main() {}");
    TEST_REQUIRE(source.HasUniform("kColor"));
    TEST_REQUIRE(source.HasVarying("vUv"));
    TEST_REQUIRE(source.HasUniform("vUv") == false);

    const auto& glsl = source.GetSource();
    TEST_REQUIRE(base::StartsWith(glsl, "#version 300 es"));
    TEST_REQUIRE(base::Contains(glsl, "precision highp float;"));
    TEST_REQUIRE(base::Contains(glsl, "uniform vec4 kColor;"));
    TEST_REQUIRE(base::Contains(glsl, "in vec2 vUv;"));
    TEST_REQUIRE(base::Contains(glsl, "layout(location=0) out vec4 out_fragColor0;"));
    TEST_REQUIRE(base::Contains(glsl, "layout(location=1) out vec4 out_fragColor1;"));
    TEST_REQUIRE(base::Contains(glsl, "void main() {}"));

    const auto& decls = source.GetDeclarationSource();
    TEST_REQUIRE(base::Contains(decls, "uniform vec4 kColor;"));
    TEST_REQUIRE(base::Contains(decls, "#version") == false);
    TEST_REQUIRE(base::Contains(decls, "void main") == false);
}

void unit_test_billboard_composition()
{
    TEST_CASE(test::Type::Feature)

    swarm::BillboardShader shader(MakeParams());

    const auto& vs = shader.GetVertexSource();
    const auto& fs = shader.GetFragmentSource();
    TEST_REQUIRE(base::StartsWith(vs, "#version 300 es"));
    TEST_REQUIRE(base::StartsWith(fs, "#version 300 es"));
    TEST_REQUIRE(swarm::FindAnchors(vs).empty());
    TEST_REQUIRE(swarm::FindAnchors(fs).empty());

    // declarations
    TEST_REQUIRE(base::Contains(vs, "uniform float uAlpha;"));
    TEST_REQUIRE(base::Contains(fs, "uniform float uAlpha;"));
    TEST_REQUIRE(base::Contains(vs, "uniform sampler2D uTexture;"));
    TEST_REQUIRE(base::Contains(fs, "uniform sampler2D uTexture;"));
    TEST_REQUIRE(base::Contains(vs, "in vec3 aOffset;"));
    TEST_REQUIRE(base::Contains(fs, "aOffset") == false);
    TEST_REQUIRE(base::Contains(vs, "out vec2 v_tint;"));
    TEST_REQUIRE(base::Contains(fs, "in vec2 v_tint;"));

    // wrapped fragments
    TEST_REQUIRE(base::Contains(vs, "void getBillboard(out vec3 modelPosition, out mat2 localTransform, out vec2 tint) {"));
    TEST_REQUIRE(base::Contains(vs, "modelPosition = aOffset;"));
    TEST_REQUIRE(base::Contains(vs, "getBillboard(modelPosition, localTransform, v_tint);"));
    TEST_REQUIRE(base::Contains(fs, "vec4 getColor(const vec2 uv, const vec2 tint) {"));
    TEST_REQUIRE(base::Contains(fs, "return vec4(tint, 0.0, 1.0);"));
    TEST_REQUIRE(base::Contains(fs, "diffuseColor.rgb = getColor(vUv, v_tint).rgb;"));

    // packing functions are available in both stages.
    TEST_REQUIRE(base::Contains(vs, "vec2 unpackRGBATo2Half(const vec4 v)"));
    TEST_REQUIRE(base::Contains(fs, "vec4 pack2HalfToRGBA(const vec2 v)"));

    // camera up and default origin
    TEST_REQUIRE(base::Contains(vs, "vec3 up = normalize(vec3(viewMatrix[0][1], viewMatrix[1][1], viewMatrix[2][1]));"));
    TEST_REQUIRE(base::Contains(vs, "const vec2 origin2d = vec2(0.000, 0.000);"));

    // lock axis is normalized and the origin is formatted with 3 decimals.
    {
        auto params = MakeParams();
        params.lock_axis = glm::vec3(0.0f, 2.0f, 0.0f);
        params.origin    = glm::vec2(0.25f, -0.5f);
        swarm::BillboardShader locked(params);
        TEST_REQUIRE(base::Contains(locked.GetVertexSource(), "const vec3 up = vec3(0.000000,1.000000,0.000000);"));
        TEST_REQUIRE(base::Contains(locked.GetVertexSource(), "const vec2 origin2d = vec2(0.250, -0.500);"));
        TEST_REQUIRE(locked.GetProgramId() != shader.GetProgramId());
    }

    // phong
    {
        auto params = MakeParams();
        params.material = swarm::BillboardShader::Material::Phong;
        swarm::BillboardShader phong(params);
        TEST_REQUIRE(base::Contains(phong.GetFragmentSource(), "uniform vec3 lightDirection;"));
        TEST_REQUIRE(base::Contains(phong.GetFragmentSource(), "diffuseColor.rgb = getColor(vUv, v_tint).rgb;"));
        TEST_REQUIRE(base::Contains(fs, "lightDirection") == false);
        TEST_REQUIRE(phong.GetVertexSource() == shader.GetVertexSource());
        TEST_REQUIRE(phong.GetProgramId() != shader.GetProgramId());

        float shininess = 0.0f;
        TEST_REQUIRE(phong.GetProgramState().GetUniform("shininess", &shininess));
        TEST_REQUIRE(real::equals(shininess, 30.0f));
        TEST_REQUIRE(shader.GetProgramState().HasUniform("shininess") == false);
    }
}

void unit_test_billboard_errors()
{
    TEST_CASE(test::Type::Feature)

    using Shader = swarm::BillboardShader;

    // unsupported material
    {
        auto params = MakeParams();
        params.material = static_cast<Shader::Material>(123);
        TEST_EXCEPTION(Shader shader(params));
    }
    TEST_EXCEPTION(Shader::ParseMaterial("Lambert"));
    TEST_REQUIRE(Shader::ParseMaterial("Phong") == Shader::Material::Phong);
    TEST_REQUIRE(Shader::ParseMaterial("Basic") == Shader::Material::Basic);

    // duplicate name across declaration kinds
    {
        auto params = MakeParams();
        params.attributes.push_back({"uAlpha", Shader::AttributeType::Float});
        TEST_EXCEPTION(Shader shader(params));
    }
    // duplicate varying
    {
        auto params = MakeParams();
        params.varyings.push_back({"tint", Shader::VaryingType::Float});
        TEST_EXCEPTION(Shader shader(params));
    }
    // varying colliding with another varying's program scope name
    {
        auto params = MakeParams();
        params.uniforms.push_back({"v_tint", swarm::UniformType::Float, 1.0f});
        TEST_EXCEPTION(Shader shader(params));
    }
    // invalid identifier
    {
        auto params = MakeParams();
        params.uniforms.push_back({"1foo", swarm::UniformType::Float, 1.0f});
        TEST_EXCEPTION(Shader shader(params));
    }
    // reserved skeleton name
    {
        auto params = MakeParams();
        params.uniforms.push_back({"modelMatrix", swarm::UniformType::Mat4, glm::mat4(1.0f)});
        TEST_EXCEPTION(Shader shader(params));
    }
    // value type doesn't match the declared type
    {
        auto params = MakeParams();
        params.uniforms.push_back({"uColor", swarm::UniformType::Vec4, 1.0f});
        TEST_EXCEPTION(Shader shader(params));
    }
    // zero length lock axis
    {
        auto params = MakeParams();
        params.lock_axis = glm::vec3(0.0f);
        TEST_EXCEPTION(Shader shader(params));
    }
}

void unit_test_billboard_program_id()
{
    TEST_CASE(test::Type::Feature)

    using Shader = swarm::BillboardShader;

    const Shader a(MakeParams());
    const Shader b(MakeParams());
    TEST_REQUIRE(a.GetProgramId() == b.GetProgramId());
    TEST_REQUIRE(base::StartsWith(a.GetProgramId(), "billboard-program-"));

    {
        auto params = MakeParams();
        params.color_code = "return vec4(1.0);";
        TEST_REQUIRE(Shader(params).GetProgramId() != a.GetProgramId());
    }
    {
        auto params = MakeParams();
        params.billboard_code += "\n// different";
        TEST_REQUIRE(Shader(params).GetProgramId() != a.GetProgramId());
    }
    {
        auto params = MakeParams();
        params.varyings[0].type = Shader::VaryingType::Vec4;
        params.color_code = "return tint;";
        TEST_REQUIRE(Shader(params).GetProgramId() != a.GetProgramId());
    }
    // the uniform values are state, not program.
    {
        auto params = MakeParams();
        params.uniforms[0].value = 1.0f;
        TEST_REQUIRE(Shader(params).GetProgramId() == a.GetProgramId());
    }

    // equal configurations share the device program.
    TestDevice device;
    auto p0 = a.GetProgram(device);
    auto p1 = b.GetProgram(device);
    TEST_REQUIRE(p0 && p1);
    TEST_REQUIRE(p0 == p1);
    TEST_REQUIRE(device.GetNumProgramsCreated() == 1);
    TEST_REQUIRE(device.GetProgram(a.GetProgramId())->GetVertexSource() == a.GetVertexSource());
    TEST_REQUIRE(device.GetProgram(a.GetProgramId())->GetFragmentSource() == a.GetFragmentSource());
}

void unit_test_billboard_geometry()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::BillboardShader shader(MakeParams());
    auto geometry = shader.GetGeometry(device);
    TEST_REQUIRE(geometry);
    TEST_REQUIRE(shader.GetGeometry(device) == geometry);

    const auto* test_geometry = device.GetGeometry("billboard-quad");
    TEST_REQUIRE(test_geometry);
    const auto& buffer = test_geometry->GetBuffer();
    TEST_REQUIRE(buffer.GetVertexCount() == 6);
    TEST_REQUIRE(buffer.GetNumDrawCmds() == 1);
    TEST_REQUIRE(buffer.GetLayout().FindAttribute("position"));
    TEST_REQUIRE(buffer.GetLayout().FindAttribute("normal"));
    TEST_REQUIRE(buffer.GetLayout().FindAttribute("uv"));

    struct Vertex {
        float position[3];
        float normal[3];
        float uv[2];
    };
    static_assert(sizeof(Vertex) == 8 * sizeof(float));
    TEST_REQUIRE(buffer.GetLayout().vertex_struct_size == sizeof(Vertex));

    const float positions[] = {0.5f,0.5f, -0.5f,-0.5f, -0.5f,0.5f, 0.5f,0.5f, 0.5f,-0.5f, -0.5f,-0.5f};
    const float uvs[] = {0.0f,1.0f, 1.0f,0.0f, 1.0f,1.0f, 0.0f,1.0f, 0.0f,0.0f, 1.0f,0.0f};
    const auto* vertices = static_cast<const Vertex*>(buffer.GetVertexDataPtr());
    for (unsigned i=0; i<6; ++i)
    {
        TEST_REQUIRE(vertices[i].position[0] == positions[i*2+0]);
        TEST_REQUIRE(vertices[i].position[1] == positions[i*2+1]);
        TEST_REQUIRE(vertices[i].position[2] == 0.0f);
        TEST_REQUIRE(vertices[i].normal[2] == 1.0f);
        TEST_REQUIRE(vertices[i].uv[0] == uvs[i*2+0]);
        TEST_REQUIRE(vertices[i].uv[1] == uvs[i*2+1]);
    }
}

void unit_test_billboard_raster_state()
{
    TEST_CASE(test::Type::Feature)

    using Shader = swarm::BillboardShader;
    using BlendOp = swarm::Device::BlendOp;

    auto params = MakeParams();
    TEST_REQUIRE(Shader(params).GetRasterState().blending == BlendOp::None);
    TEST_REQUIRE(Shader(params).GetRasterState().bWriteDepth == true);
    TEST_REQUIRE(Shader(params).GetRasterState().depth_test == swarm::Device::DepthTest::LessOrEQual);

    params.transparent = true;
    TEST_REQUIRE(Shader(params).GetRasterState().blending == BlendOp::Transparent);

    params.blending = Shader::Blending::Additive;
    TEST_REQUIRE(Shader(params).GetRasterState().blending == BlendOp::Additive);

    params.blending = Shader::Blending::None;
    TEST_REQUIRE(Shader(params).GetRasterState().blending == BlendOp::None);

    params.depth_write = false;
    TEST_REQUIRE(Shader(params).GetRasterState().bWriteDepth == false);

    // the raster options don't change the program.
    TEST_REQUIRE(Shader(params).GetProgramId() == Shader(MakeParams()).GetProgramId());
}

void unit_test_billboard_uniforms()
{
    TEST_CASE(test::Type::Feature)

    swarm::BillboardShader shader(MakeParams());

    float alpha = 0.0f;
    TEST_REQUIRE(shader.GetProgramState().GetUniform("uAlpha", &alpha));
    TEST_REQUIRE(alpha == 0.5f);
    // nullptr texture is not bound.
    TEST_REQUIRE(shader.GetProgramState().FindTextureBinding("uTexture") == nullptr);

    shader.SetUniform("uAlpha", 0.25f);
    TEST_REQUIRE(shader.GetProgramState().GetUniform("uAlpha", &alpha));
    TEST_REQUIRE(alpha == 0.25f);

    TestTexture texture("texture");
    shader.SetUniform("uTexture", static_cast<const swarm::Texture*>(&texture));
    TEST_REQUIRE(shader.GetProgramState().FindTextureBinding("uTexture"));
    TEST_REQUIRE(shader.GetProgramState().FindTextureBinding("uTexture")->texture == &texture);

    TEST_EXCEPTION(shader.SetUniform("uFoo", 1.0f));
    TEST_EXCEPTION(shader.SetUniform("uAlpha", glm::vec2(1.0f)));

    // built-ins
    glm::vec3 camera;
    TEST_REQUIRE(shader.GetProgramState().GetUniform("cameraPosition", &camera));
    TEST_REQUIRE(camera == glm::vec3(0.0f, 0.0f, 1.0f));
    shader.SetCamera(glm::mat4(1.0f), glm::mat4(2.0f), glm::vec3(1.0f, 2.0f, 3.0f));
    TEST_REQUIRE(shader.GetProgramState().GetUniform("cameraPosition", &camera));
    TEST_REQUIRE(camera == glm::vec3(1.0f, 2.0f, 3.0f));
    glm::mat4 projection;
    TEST_REQUIRE(shader.GetProgramState().GetUniform("projectionMatrix", &projection));
    TEST_REQUIRE(projection == glm::mat4(2.0f));

    // light setters only apply to phong.
    shader.SetLightColor(glm::vec3(1.0f, 0.0f, 0.0f));
    TEST_REQUIRE(shader.GetProgramState().HasUniform("lightColor") == false);

    auto params = MakeParams();
    params.material = swarm::BillboardShader::Material::Phong;
    swarm::BillboardShader phong(params);
    phong.SetLightDirection(glm::vec3(0.0f, -2.0f, 0.0f));
    glm::vec3 direction;
    TEST_REQUIRE(phong.GetProgramState().GetUniform("lightDirection", &direction));
    TEST_REQUIRE(real::equals(direction.y, -1.0f));
    TEST_REQUIRE(real::equals(direction.x, 0.0f));
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_anchor_line();
    unit_test_anchor_substitution();
    unit_test_shader_source();
    unit_test_billboard_composition();
    unit_test_billboard_errors();
    unit_test_billboard_program_id();
    unit_test_billboard_geometry();
    unit_test_billboard_raster_state();
    unit_test_billboard_uniforms();
    return 0;
}
) // EXPORT_TEST_MAIN
