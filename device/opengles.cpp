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

#include <GLES3/gl3.h>

#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include <vector>
#include <string>
#include <unordered_map>

#include "warnpush.h"
#  include <glm/gtc/type_ptr.hpp>
#include "warnpop.h"

#include "base/assert.h"
#include "base/logging.h"
#include "base/utility.h"

#include "device/device.h"
#include "device/graphics.h"
#include "device/vertex.h"

static_assert(sizeof(GLint) == sizeof(int) && sizeof(GLuint) == sizeof(unsigned) && sizeof(GLfloat) == sizeof(float),
              "Basic OpenGL type sanity check");

static_assert(sizeof(int) == 4 && sizeof(unsigned) == 4 && sizeof(float) == 4 &&
              sizeof(glm::vec2) == 8 && sizeof(glm::vec3) == 12 && sizeof(glm::vec4) == 16 &&
              sizeof(glm::mat2) == 16,
              "Basic types sanity check");

#if !defined(SWARM_CHECK_OPENGL)
#  define GL_CALL(x) mGL.x
#else
#define GL_CALL(x)                                      \
do {                                                    \
    mGL.x;                                              \
    const auto err = mGL.glGetError();                  \
    if (err != GL_NO_ERROR) {                           \
        std::printf("GL Error %s @ %s,%d\n",            \
            GLEnumToStr(err), __FILE__, __LINE__);      \
        std::fflush(stdout);                            \
        std::abort();                                   \
    }                                                   \
} while(0)

#pragma message "OpenGL calls are checked!"
#endif

// The OpenGL ES 3.0 entry points used by the device. Both the
// function pointer members and their resolving are generated
// from this one list.
#define SWARM_GLES3_FUNCTIONS(X)                                          \
    X(PFNGLGETERRORPROC,                  glGetError)                     \
    X(PFNGLGETSTRINGPROC,                 glGetString)                    \
    X(PFNGLGETINTEGERVPROC,               glGetIntegerv)                  \
    X(PFNGLENABLEPROC,                    glEnable)                       \
    X(PFNGLDISABLEPROC,                   glDisable)                      \
    X(PFNGLPIXELSTOREIPROC,               glPixelStorei)                  \
    X(PFNGLVIEWPORTPROC,                  glViewport)                     \
    X(PFNGLCULLFACEPROC,                  glCullFace)                     \
    X(PFNGLFRONTFACEPROC,                 glFrontFace)                    \
    X(PFNGLBLENDFUNCPROC,                 glBlendFunc)                    \
    X(PFNGLDEPTHFUNCPROC,                 glDepthFunc)                    \
    X(PFNGLDEPTHMASKPROC,                 glDepthMask)                    \
    X(PFNGLCLEARCOLORPROC,                glClearColor)                   \
    X(PFNGLCLEARDEPTHFPROC,               glClearDepthf)                  \
    X(PFNGLCLEARPROC,                     glClear)                        \
    X(PFNGLCREATESHADERPROC,              glCreateShader)                 \
    X(PFNGLSHADERSOURCEPROC,              glShaderSource)                 \
    X(PFNGLCOMPILESHADERPROC,             glCompileShader)                \
    X(PFNGLGETSHADERIVPROC,               glGetShaderiv)                  \
    X(PFNGLGETSHADERINFOLOGPROC,          glGetShaderInfoLog)             \
    X(PFNGLDELETESHADERPROC,              glDeleteShader)                 \
    X(PFNGLCREATEPROGRAMPROC,             glCreateProgram)                \
    X(PFNGLATTACHSHADERPROC,              glAttachShader)                 \
    X(PFNGLLINKPROGRAMPROC,               glLinkProgram)                  \
    X(PFNGLGETPROGRAMIVPROC,              glGetProgramiv)                 \
    X(PFNGLGETPROGRAMINFOLOGPROC,         glGetProgramInfoLog)            \
    X(PFNGLUSEPROGRAMPROC,                glUseProgram)                   \
    X(PFNGLDELETEPROGRAMPROC,             glDeleteProgram)                \
    X(PFNGLGETUNIFORMLOCATIONPROC,        glGetUniformLocation)           \
    X(PFNGLUNIFORM1IPROC,                 glUniform1i)                    \
    X(PFNGLUNIFORM1FPROC,                 glUniform1f)                    \
    X(PFNGLUNIFORM2FPROC,                 glUniform2f)                    \
    X(PFNGLUNIFORM3FPROC,                 glUniform3f)                    \
    X(PFNGLUNIFORM4FPROC,                 glUniform4f)                    \
    X(PFNGLUNIFORMMATRIX4FVPROC,          glUniformMatrix4fv)             \
    X(PFNGLGETATTRIBLOCATIONPROC,         glGetAttribLocation)            \
    X(PFNGLVERTEXATTRIBPOINTERPROC,       glVertexAttribPointer)          \
    X(PFNGLVERTEXATTRIBDIVISORPROC,       glVertexAttribDivisor)          \
    X(PFNGLENABLEVERTEXATTRIBARRAYPROC,   glEnableVertexAttribArray)      \
    X(PFNGLDISABLEVERTEXATTRIBARRAYPROC,  glDisableVertexAttribArray)     \
    X(PFNGLGENBUFFERSPROC,                glGenBuffers)                   \
    X(PFNGLDELETEBUFFERSPROC,             glDeleteBuffers)                \
    X(PFNGLBINDBUFFERPROC,                glBindBuffer)                   \
    X(PFNGLBUFFERDATAPROC,                glBufferData)                   \
    X(PFNGLBUFFERSUBDATAPROC,             glBufferSubData)                \
    X(PFNGLGENTEXTURESPROC,               glGenTextures)                  \
    X(PFNGLDELETETEXTURESPROC,            glDeleteTextures)               \
    X(PFNGLACTIVETEXTUREPROC,             glActiveTexture)                \
    X(PFNGLBINDTEXTUREPROC,               glBindTexture)                  \
    X(PFNGLTEXIMAGE2DPROC,                glTexImage2D)                   \
    X(PFNGLTEXPARAMETERIPROC,             glTexParameteri)                \
    X(PFNGLGENFRAMEBUFFERSPROC,           glGenFramebuffers)              \
    X(PFNGLDELETEFRAMEBUFFERSPROC,        glDeleteFramebuffers)           \
    X(PFNGLBINDFRAMEBUFFERPROC,           glBindFramebuffer)              \
    X(PFNGLFRAMEBUFFERTEXTURE2DPROC,      glFramebufferTexture2D)         \
    X(PFNGLCHECKFRAMEBUFFERSTATUSPROC,    glCheckFramebufferStatus)       \
    X(PFNGLDRAWBUFFERSPROC,               glDrawBuffers)                  \
    X(PFNGLREADBUFFERPROC,                glReadBuffer)                   \
    X(PFNGLREADPIXELSPROC,                glReadPixels)                   \
    X(PFNGLDRAWARRAYSPROC,                glDrawArrays)                   \
    X(PFNGLDRAWARRAYSINSTANCEDPROC,       glDrawArraysInstanced)

namespace
{

const char* GLEnumToStr(GLenum eval)
{

#define CASE(x) case x: return #x
    switch (eval)
    {
        CASE(GL_NO_ERROR);
        CASE(GL_INVALID_ENUM);
        CASE(GL_INVALID_VALUE);
        CASE(GL_INVALID_OPERATION);
        CASE(GL_INVALID_FRAMEBUFFER_OPERATION);
        CASE(GL_OUT_OF_MEMORY);
        CASE(GL_FRAMEBUFFER_COMPLETE);
        CASE(GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT);
        CASE(GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT);
        CASE(GL_FRAMEBUFFER_INCOMPLETE_DIMENSIONS);
        CASE(GL_FRAMEBUFFER_UNSUPPORTED);
    }
    return "???";
#undef CASE
}

// The pointers are members of an object instead of global
// function pointers since the addresses can differ between
// contexts depending on the context configuration.
struct OpenGLFunctions
{
#define DECLARE_GL_FUNCTION(type, name) type name = nullptr;
    SWARM_GLES3_FUNCTIONS(DECLARE_GL_FUNCTION)
#undef DECLARE_GL_FUNCTION
};

//
// OpenGL ES 3.0 based graphics device implementation.
// Multiple color attachments (glDrawBuffers) and instanced
// rendering (glDrawArraysInstanced, glVertexAttribDivisor) are
// core functionality and are assumed to be always available.
class OpenGLES3GraphicsDevice : public std::enable_shared_from_this<OpenGLES3GraphicsDevice>
                              , public dev::Device
                              , public dev::GraphicsDevice {

private:
    struct CachedUniform {
        GLint location = -1;
    };
    struct BufferObject {
        dev::BufferUsage usage = dev::BufferUsage::Static;
        GLuint name = 0;
        size_t capacity = 0;
        size_t offset = 0;
        size_t refcount = 0;
    };
    struct TextureState {
        GLenum wrap_x = GL_NONE;
        GLenum wrap_y = GL_NONE;
        GLenum min_filter = GL_NONE;
        GLenum mag_filter = GL_NONE;
    };
    using UniformCache = std::unordered_map<std::string, CachedUniform>;

    std::shared_ptr<dev::Context> mContextImpl;
    dev::Context* mContext = nullptr;

    mutable std::unordered_map<unsigned, UniformCache> mUniformCache;
    mutable std::unordered_map<unsigned, TextureState> mTextureState;
    // vertex attribute arrays enabled by the previous vertex buffer bindings.
    mutable std::vector<GLuint> mEnabledVertexAttribs;

    std::vector<BufferObject> mVertexBuffers;

    unsigned mTempTextureUnitIndex = 0;
    unsigned mTextureUnitCount = 0;
    unsigned mColorAttachmentCount = 0;
    unsigned mMaxTextureSize = 0;

    OpenGLFunctions mGL;
private:

    CachedUniform& GetUniformFromCache(const dev::GraphicsProgram& program, const std::string& name) const
    {
        auto& cache = mUniformCache[program.handle];

        auto it = cache.find(name);
        if (it != std::end(cache))
            return it->second;

        CachedUniform uniform;
        uniform.location = mGL.glGetUniformLocation(program.handle, name.c_str());
        cache[name] = uniform;
        return cache[name];
    }

public:
    explicit OpenGLES3GraphicsDevice(dev::Context* context) noexcept
       : mContext(context)
    {
#define RESOLVE_GL_FUNCTION(type, name) mGL.name = reinterpret_cast<type>(mContext->Resolve(#name));
        SWARM_GLES3_FUNCTIONS(RESOLVE_GL_FUNCTION)
#undef RESOLVE_GL_FUNCTION

        GLint max_texture_units = 0;
        GLint max_texture_size = 0;
        GLint max_color_attachments = 0;
        GLint max_draw_buffers = 0;
        GLint max_vertex_attribs = 0;
        GL_CALL(glGetIntegerv(GL_MAX_TEXTURE_IMAGE_UNITS, &max_texture_units));
        GL_CALL(glGetIntegerv(GL_MAX_TEXTURE_SIZE, &max_texture_size));
        GL_CALL(glGetIntegerv(GL_MAX_COLOR_ATTACHMENTS, &max_color_attachments));
        GL_CALL(glGetIntegerv(GL_MAX_DRAW_BUFFERS, &max_draw_buffers));
        GL_CALL(glGetIntegerv(GL_MAX_VERTEX_ATTRIBS, &max_vertex_attribs));
        mMaxTextureSize = max_texture_size;

        // provide the INFO level device information only once.
        static bool have_printed_info = false;
        if (have_printed_info)
        {
            DEBUG("GL %1 Vendor: %2, %3",
                  mGL.glGetString(GL_VERSION),
                  mGL.glGetString(GL_VENDOR),
                  mGL.glGetString(GL_RENDERER));
        }
        else
        {
            INFO("GL %1 Vendor: %2, %3",
                 mGL.glGetString(GL_VERSION),
                 mGL.glGetString(GL_VENDOR),
                 mGL.glGetString(GL_RENDERER));
            INFO("Fragment shader texture units: %1", max_texture_units);
            INFO("Maximum texture size %1x%2", max_texture_size, max_texture_size);
            INFO("Maximum color attachments: %1", max_color_attachments);
            INFO("Maximum draw buffers: %1", max_draw_buffers);
            INFO("Maximum vertex attributes: %1", max_vertex_attribs);
        }

        // we use this for uploading textures so we don't
        // need to play games with the "actual" texture units.
        mTempTextureUnitIndex = max_texture_units - 1;
        mTextureUnitCount = max_texture_units - 1; // see the temp
        mColorAttachmentCount = std::min(max_color_attachments, max_draw_buffers);

        // the billboard quads and the state quad are both counter
        // clockwise so the front face never changes.
        GL_CALL(glPixelStorei(GL_UNPACK_ALIGNMENT, 1));
        GL_CALL(glPixelStorei(GL_PACK_ALIGNMENT, 1));
        GL_CALL(glFrontFace(GL_CCW));
        GL_CALL(glDisable(GL_DEPTH_TEST));
        GL_CALL(glEnable(GL_CULL_FACE));
        GL_CALL(glCullFace(GL_BACK));

        have_printed_info = true;
    }

    explicit OpenGLES3GraphicsDevice(std::shared_ptr<dev::Context> context) noexcept
            : OpenGLES3GraphicsDevice(context.get())
    {
        mContextImpl = std::move(context);
    }

    ~OpenGLES3GraphicsDevice() override
    {
        DEBUG("Destroy dev::GraphicsDevice");

        for (auto& buffer: mVertexBuffers)
        {
            GL_CALL(glDeleteBuffers(1, &buffer.name));
        }
    }

    static GLenum GetEnum(dev::TextureWrapping wrapping)
    {
        switch (wrapping)
        {
            case dev::TextureWrapping::Clamp:  return GL_CLAMP_TO_EDGE;
            case dev::TextureWrapping::Repeat: return GL_REPEAT;
        }
        BUG("Bug on GL texture wrapping mode.");
        return GL_NONE;
    }
    static GLenum GetEnum(dev::TextureMinFilter filter)
    {
        // the default filter is resolved by the caller.
        switch (filter)
        {
            case dev::TextureMinFilter::Nearest: return GL_NEAREST;
            case dev::TextureMinFilter::Linear:  return GL_LINEAR;
            case dev::TextureMinFilter::Default: break;
        }
        BUG("Bug on min texture filter.");
        return GL_NONE;
    }
    static GLenum GetEnum(dev::TextureMagFilter filter)
    {
        switch (filter)
        {
            case dev::TextureMagFilter::Nearest: return GL_NEAREST;
            case dev::TextureMagFilter::Linear:  return GL_LINEAR;
            case dev::TextureMagFilter::Default: break;
        }
        BUG("Bug on mag texture filter.");
        return GL_NONE;
    }
    static GLenum GetEnum(dev::ShaderType shader)
    {
        switch (shader)
        {
            case dev::ShaderType::VertexShader:   return GL_VERTEX_SHADER;
            case dev::ShaderType::FragmentShader: return GL_FRAGMENT_SHADER;
            case dev::ShaderType::Invalid: break;
        }
        BUG("Bug on shader type.");
        return GL_NONE;
    }
    static GLenum GetEnum(dev::BufferUsage usage)
    {
        switch (usage)
        {
            case dev::BufferUsage::Static:  return GL_STATIC_DRAW;
            case dev::BufferUsage::Stream:  return GL_STREAM_DRAW;
            case dev::BufferUsage::Dynamic: return GL_DYNAMIC_DRAW;
        }
        BUG("Bug on buffer usage.");
        return GL_NONE;
    }

    void DeleteShader(const dev::GraphicsShader& shader) override
    {
        GL_CALL(glDeleteShader(shader.handle));
    }

    void DeleteProgram(const dev::GraphicsProgram& program) override
    {
        GL_CALL(glDeleteProgram(program.handle));

        mUniformCache.erase(program.handle);
    }

    dev::Framebuffer GetDefaultFramebuffer() const override
    {
        dev::Framebuffer framebuffer;
        framebuffer.handle = 0;
        framebuffer.format = dev::FramebufferFormat::ColorRGBA8;
        return framebuffer;
    }

    dev::Framebuffer CreateFramebuffer(const dev::FramebufferConfig& config) override
    {
        ASSERT(config.format == dev::FramebufferFormat::ColorRGBA8);
        if (config.width > mMaxTextureSize || config.height > mMaxTextureSize)
        {
            ERROR("Framebuffer size exceeds device limit. [size=%1x%2, max=%3]",
                  config.width, config.height, mMaxTextureSize);
            return dev::Framebuffer{};
        }

        // The color targets are textures that are attached separately
        // so the same FBO can be pointed at a new set of textures.
        GLuint handle = 0;
        GL_CALL(glGenFramebuffers(1, &handle));
        GL_CALL(glBindFramebuffer(GL_FRAMEBUFFER, handle));

        dev::Framebuffer fbo;
        fbo.handle = handle;
        fbo.height = config.height;
        fbo.width  = config.width;
        fbo.format = config.format;
        return fbo;
    }

    void BindRenderTargetTexture2D(const dev::Framebuffer& framebuffer, const dev::TextureObject& texture,
                                   unsigned color_attachment) override
    {
        ASSERT(framebuffer.IsValid());
        ASSERT(framebuffer.IsCustom());
        ASSERT(texture.IsValid());
        ASSERT(color_attachment < mColorAttachmentCount);
        GL_CALL(glBindFramebuffer(GL_FRAMEBUFFER, framebuffer.handle));
        GL_CALL(glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0 + color_attachment, GL_TEXTURE_2D,
                                       texture.handle, 0));
    }

    bool CompleteFramebuffer(const dev::Framebuffer& framebuffer,
                             const std::vector<unsigned>& color_attachments) override
    {
        ASSERT(framebuffer.IsValid());
        ASSERT(framebuffer.IsCustom());
        ASSERT(!color_attachments.empty());

        if (color_attachments.size() > mColorAttachmentCount)
        {
            ERROR("Framebuffer color attachment count exceeds device limit. [count=%1, max=%2]",
                  color_attachments.size(), mColorAttachmentCount);
            return false;
        }

        // the fragment shader output at location N writes to
        // the Nth draw buffer.
        std::vector<GLenum> draw_buffers;
        for (unsigned i = 0; i < color_attachments.size(); ++i)
        {
            draw_buffers.push_back(GL_COLOR_ATTACHMENT0 + color_attachments[i]);
        }
        GL_CALL(glBindFramebuffer(GL_FRAMEBUFFER, framebuffer.handle));
        GL_CALL(glDrawBuffers(static_cast<GLsizei>(draw_buffers.size()), &draw_buffers[0]));

        // possible FBO *error* statuses are: INCOMPLETE_ATTACHMENT, INCOMPLETE_DIMENSIONS and
        // INCOMPLETE_MISSING_ATTACHMENT. These are bugs in the code that is trying to create the
        // frame buffer object and has violated the frame buffer completeness requirements.
        const auto ret = mGL.glCheckFramebufferStatus(GL_FRAMEBUFFER);
        if (ret == GL_FRAMEBUFFER_COMPLETE)
            return true;
        else if (ret == GL_FRAMEBUFFER_UNSUPPORTED)
        {
            ERROR("Unsupported framebuffer configuration. [fbo=%1]", framebuffer.handle);
            return false;
        }
        else if (ret == GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT) BUG("Incomplete FBO attachment.");
        else if (ret == GL_FRAMEBUFFER_INCOMPLETE_DIMENSIONS) BUG("Incomplete FBO dimensions.");
        else if (ret == GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT) BUG("Incomplete FBO, missing attachment.");
        return false;
    }

    void BindFramebuffer(const dev::Framebuffer& framebuffer) const override
    {
        ASSERT(framebuffer.IsValid());
        GL_CALL(glBindFramebuffer(GL_FRAMEBUFFER, framebuffer.handle));
    }

    void DeleteFramebuffer(const dev::Framebuffer& framebuffer) override
    {
        ASSERT(framebuffer.IsValid());
        ASSERT(framebuffer.IsCustom());

        GL_CALL(glDeleteFramebuffers(1, &framebuffer.handle));
    }

    dev::GraphicsShader CompileShader(const std::string& source, dev::ShaderType type, std::string* compile_info) override
    {
        GLint status = 0;
        GLuint shader = mGL.glCreateShader(GetEnum(type));

        const char* source_ptr = source.c_str();
        GL_CALL(glShaderSource(shader, 1, &source_ptr, nullptr));
        GL_CALL(glCompileShader(shader));
        GL_CALL(glGetShaderiv(shader, GL_COMPILE_STATUS, &status));

        GLint length = 0;
        GL_CALL(glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length));

        compile_info->resize(length);
        if (length)
        {
            GL_CALL(glGetShaderInfoLog(shader, length, nullptr, &(*compile_info)[0]));
        }

        if (status == 0)
        {
            GL_CALL(glDeleteShader(shader));
            return {0, dev::ShaderType::Invalid};
        }
        return {static_cast<unsigned>(shader), type};
    }

    dev::GraphicsProgram BuildProgram(const std::vector<dev::GraphicsShader>& shaders, std::string* build_info) override
    {
        GLuint program = mGL.glCreateProgram();
        for (const auto& shader: shaders)
        {
            ASSERT(shader.IsValid());
            GL_CALL(glAttachShader(program, shader.GetHandle()));
        }
        GL_CALL(glLinkProgram(program));

        GLint link_status = 0;
        GL_CALL(glGetProgramiv(program, GL_LINK_STATUS, &link_status));

        GLint length = 0;
        GL_CALL(glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length));

        build_info->resize(length);
        if (length)
        {
            GL_CALL(glGetProgramInfoLog(program, length, nullptr, &(*build_info)[0]));
        }

        if (link_status == 0)
        {
            GL_CALL(glDeleteProgram(program));
            return {0};
        }
        return {program};
    }

    dev::TextureObject AllocateTexture2D(unsigned texture_width,
                                         unsigned texture_height, dev::TextureFormat format) override
    {
        return UploadTexture2D(nullptr, texture_width, texture_height, format);
    }

    dev::TextureObject UploadTexture2D(const void* bytes,
                                       unsigned texture_width,
                                       unsigned texture_height, dev::TextureFormat format) override
    {
        ASSERT(format == dev::TextureFormat::RGBA);
        if (texture_width > mMaxTextureSize || texture_height > mMaxTextureSize)
        {
            ERROR("Texture size exceeds device limit. [size=%1x%2, max=%3]",
                  texture_width, texture_height, mMaxTextureSize);
            return dev::TextureObject{};
        }

        // RGBA8 is color renderable so the same storage works both
        // as a sampler source and as a framebuffer color target.
        GLuint handle = 0;
        GL_CALL(glGenTextures(1, &handle));
        GL_CALL(glActiveTexture(GL_TEXTURE0 + mTempTextureUnitIndex));
        GL_CALL(glBindTexture(GL_TEXTURE_2D, handle));
        GL_CALL(glTexImage2D(GL_TEXTURE_2D, 0 /*mip*/, GL_RGBA8, texture_width, texture_height, 0 /*border*/,
                             GL_RGBA, GL_UNSIGNED_BYTE, bytes));

        // the texture parameters are set lazily when the texture is bound
        // for sampling. Until then there's no valid sampling state.
        auto& texture_state = mTextureState[handle];
        texture_state = TextureState{};

        dev::TextureObject ret;
        ret.handle = handle;
        ret.format = format;
        ret.texture_width = texture_width;
        ret.texture_height = texture_height;
        return ret;
    }

    bool BindTexture2D(const dev::TextureObject& texture, const dev::GraphicsProgram& program, const std::string& sampler_name, unsigned texture_unit,
                       dev::TextureWrapping texture_x_wrap, dev::TextureWrapping texture_y_wrap,
                       dev::TextureMinFilter texture_min_filter, dev::TextureMagFilter texture_mag_filter) const override
    {
        ASSERT(texture.IsValid());
        ASSERT(texture.texture_width && texture.texture_height);

        if (texture_unit >= mTextureUnitCount)
        {
            ERROR("Texture unit index exceeds the maximum available texture units. [unit=%1, available=%2]",
                  texture_unit, mTextureUnitCount);
            return false;
        }

        const auto& sampler = GetUniformFromCache(program, sampler_name);
        if (sampler.location == -1)
            return true;

        const auto internal_texture_min_filter = GetEnum(texture_min_filter);
        const auto internal_texture_mag_filter = GetEnum(texture_mag_filter);
        const auto internal_texture_x_wrap = GetEnum(texture_x_wrap);
        const auto internal_texture_y_wrap = GetEnum(texture_y_wrap);

        auto& texture_state = mTextureState[texture.handle];

        GL_CALL(glActiveTexture(GL_TEXTURE0 + texture_unit));
        GL_CALL(glBindTexture(GL_TEXTURE_2D, texture.handle));

        if (texture_state.min_filter != internal_texture_min_filter ||
            texture_state.mag_filter != internal_texture_mag_filter ||
            texture_state.wrap_x != internal_texture_x_wrap ||
            texture_state.wrap_y != internal_texture_y_wrap)
        {
            GL_CALL(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, internal_texture_x_wrap));
            GL_CALL(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, internal_texture_y_wrap));
            GL_CALL(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, internal_texture_mag_filter));
            GL_CALL(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, internal_texture_min_filter));
            texture_state.mag_filter = internal_texture_mag_filter;
            texture_state.min_filter = internal_texture_min_filter;
            texture_state.wrap_x = internal_texture_x_wrap;
            texture_state.wrap_y = internal_texture_y_wrap;
        }
        // set the texture unit to the sampler
        GL_CALL(glUseProgram(program.handle));
        GL_CALL(glUniform1i(sampler.location, texture_unit));
        return true;
    }

    void DeleteTexture(const dev::TextureObject& texture) override
    {
        GL_CALL(glDeleteTextures(1, &texture.handle));

        mTextureState.erase(texture.handle);
    }

    dev::GraphicsBuffer AllocateBuffer(size_t bytes, dev::BufferUsage usage, dev::BufferType type) override
    {
        ASSERT(type == dev::BufferType::VertexBuffer);

        // Static and streaming buffers are bump allocated from larger
        // buffer objects. Static allocations are only released when the
        // whole buffer object is no longer referenced. Streaming buffers
        // are reset on every new frame. Dynamic buffers get a buffer
        // object each and leave the fragmentation to the driver.
        size_t capacity = 0;
        if (usage == dev::BufferUsage::Static)
            capacity = std::max(size_t(1024 * 1024), bytes);
        else if (usage == dev::BufferUsage::Stream)
            capacity = std::max(size_t(1024 * 1024), bytes);
        else if (usage == dev::BufferUsage::Dynamic)
            capacity = bytes;
        else BUG("Unsupported vertex buffer type.");

        for (size_t buffer_index = 0; buffer_index < mVertexBuffers.size(); ++buffer_index)
        {
            auto& buffer = mVertexBuffers[buffer_index];
            const auto available = buffer.capacity - buffer.offset;
            if ((available >= bytes) && (buffer.usage == usage))
            {
                const auto offset = buffer.offset;
                buffer.offset += bytes;
                buffer.refcount++;
                return dev::GraphicsBuffer{buffer.name, type, buffer_index, offset, bytes};
            }
        }

        BufferObject buffer;
        buffer.usage = usage;
        buffer.offset = bytes;
        buffer.capacity = capacity;
        buffer.refcount = 1;

        GL_CALL(glGenBuffers(1, &buffer.name));
        GL_CALL(glBindBuffer(GL_ARRAY_BUFFER, buffer.name));
        GL_CALL(glBufferData(GL_ARRAY_BUFFER, buffer.capacity, nullptr, GetEnum(usage)));

        mVertexBuffers.push_back(buffer);

        DEBUG("Allocated new buffer object. [bo=%1, size=%2, usage=%3]",
              buffer.name, buffer.capacity, usage);

        const auto buffer_index = mVertexBuffers.size() - 1;
        const auto buffer_offset = 0;
        return dev::GraphicsBuffer{buffer.name, type, buffer_index, buffer_offset, bytes};
    }

    void FreeBuffer(const dev::GraphicsBuffer& buffer) override
    {
        ASSERT(buffer.buffer_index < mVertexBuffers.size());
        auto& buffer_object = mVertexBuffers[buffer.buffer_index];
        ASSERT(buffer_object.refcount > 0);
        buffer_object.refcount--;

        if (buffer_object.usage == dev::BufferUsage::Static || buffer_object.usage == dev::BufferUsage::Dynamic)
        {
            if (buffer_object.refcount == 0)
                buffer_object.offset = 0;
        }
        if (buffer_object.usage == dev::BufferUsage::Static)
        {
            DEBUG("Free buffer data. [bo=%1, bytes=%2, offset=%3, refs=%4]",
                  buffer_object.name, buffer.buffer_bytes, buffer.buffer_offset, buffer_object.refcount);
        }
    }

    void UploadBuffer(const dev::GraphicsBuffer& buffer, const void* data, size_t bytes) override
    {
        ASSERT(buffer.buffer_index < mVertexBuffers.size());

        auto& buffer_object = mVertexBuffers[buffer.buffer_index];
        ASSERT(bytes <= buffer.buffer_bytes);
        ASSERT(buffer.buffer_offset + bytes <= buffer_object.capacity);

        GL_CALL(glBindBuffer(GL_ARRAY_BUFFER, buffer_object.name));
        GL_CALL(glBufferSubData(GL_ARRAY_BUFFER, buffer.buffer_offset, bytes, data));

        if (buffer_object.usage == dev::BufferUsage::Static)
        {
            const int percent_full = 100 * (double) buffer_object.offset / (double) buffer_object.capacity;
            DEBUG("Uploaded buffer data. [bo=%1, bytes=%2, offset=%3, full=%4%]",
                  buffer_object.name, bytes, buffer.buffer_offset, percent_full);
        }
    }

    void BindVertexBuffer(const dev::GraphicsBuffer& buffer,
                          const dev::GraphicsProgram& program,
                          const dev::VertexLayout& vertex_layout) const override
    {
        ASSERT(buffer.IsValid());
        ASSERT(program.IsValid());
        ASSERT(buffer.type == dev::BufferType::VertexBuffer);

        // with a VBO the glVertexAttribPointer 'pointer' argument
        // is an offset into the contents of the VBO.
        const auto* base_ptr = reinterpret_cast<const uint8_t*>(buffer.buffer_offset);

        GL_CALL(glBindBuffer(GL_ARRAY_BUFFER, buffer.handle));
        for (const auto& attr: vertex_layout.attributes)
        {
            const GLint location = mGL.glGetAttribLocation(program.handle, attr.name.c_str());
            if (location == -1)
                continue;
            // matrix attributes take one location per column.
            const auto size = attr.num_vector_components;
            const auto stride = vertex_layout.vertex_struct_size;
            for (unsigned column=0; column<attr.num_columns; ++column)
            {
                const GLuint column_location = location + column;
                const auto attr_ptr = base_ptr + attr.offset + column * size * sizeof(float);
                GL_CALL(glVertexAttribPointer(column_location, size, GL_FLOAT, GL_FALSE, stride, attr_ptr));
                GL_CALL(glVertexAttribDivisor(column_location, attr.divisor));
                GL_CALL(glEnableVertexAttribArray(column_location));
                mEnabledVertexAttribs.push_back(column_location);
            }
        }
    }

    void SetProgramState(const dev::GraphicsProgram& program, const dev::ProgramState& state) const override
    {
        GL_CALL(glUseProgram(program.handle));

        // vertex attribute arrays of the previous program would otherwise
        // stay enabled and be sourced on the next draw.
        for (auto location : mEnabledVertexAttribs)
        {
            GL_CALL(glVertexAttribDivisor(location, 0));
            GL_CALL(glDisableVertexAttribArray(location));
        }
        mEnabledVertexAttribs.clear();

        // flush pending uniforms onto the GPU program object
        for (size_t i = 0; i < state.uniforms.size(); ++i)
        {
            const auto* uniform_setting = state.uniforms[i];
            const auto& uniform_binding = GetUniformFromCache(program, uniform_setting->name);
            if (uniform_binding.location == -1)
                continue;

            const auto& value = uniform_setting->value;
            const auto location = uniform_binding.location;

            // if the glUniformXYZ gives GL_INVALID_OPERATION a possible
            // cause is using wrong API for the uniform. for example
            // calling glUniform1f when the uniform is an int.

            if (const auto* ptr = std::get_if<int>(&value))
                GL_CALL(glUniform1i(location, *ptr));
            else if (const auto* ptr = std::get_if<float>(&value))
                GL_CALL(glUniform1f(location, *ptr));
            else if (const auto* ptr = std::get_if<glm::vec2>(&value))
                GL_CALL(glUniform2f(location, ptr->x, ptr->y));
            else if (const auto* ptr = std::get_if<glm::vec3>(&value))
                GL_CALL(glUniform3f(location, ptr->x, ptr->y, ptr->z));
            else if (const auto* ptr = std::get_if<glm::vec4>(&value))
                GL_CALL(glUniform4f(location, ptr->x, ptr->y, ptr->z, ptr->w));
            else if (const auto* ptr = std::get_if<glm::mat4>(&value))
                GL_CALL(glUniformMatrix4fv(location, 1, GL_FALSE /*transpose*/, glm::value_ptr(*ptr)));
            else
                BUG("Unhandled shader program uniform type.");
        }
    }

    void SetViewportState(const dev::ViewportState& state) const override
    {
        GL_CALL(glViewport(state.x, state.y, state.width, state.height));
    }
    dev::ViewportState GetViewportState() const override
    {
        GLint viewport[4] = {0, 0, 0, 0};
        GL_CALL(glGetIntegerv(GL_VIEWPORT, viewport));
        dev::ViewportState state;
        state.x      = viewport[0];
        state.y      = viewport[1];
        state.width  = viewport[2];
        state.height = viewport[3];
        return state;
    }

    void SetPipelineState(const dev::GraphicsPipelineState& state) const override
    {
        switch (state.blending)
        {
            case dev::BlendOp::None:
                GL_CALL(glDisable(GL_BLEND));
                break;
            case dev::BlendOp::Transparent:
                GL_CALL(glEnable(GL_BLEND));
                GL_CALL(glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA));
                break;
            case dev::BlendOp::Additive:
                GL_CALL(glEnable(GL_BLEND));
                GL_CALL(glBlendFunc(GL_SRC_ALPHA, GL_ONE));
                break;
        }

        if (state.culling == dev::Culling::None)
            GL_CALL(glDisable(GL_CULL_FACE));
        else GL_CALL(glEnable(GL_CULL_FACE));

        // with the depth test disabled the depth buffer isn't written
        // either, regardless of the depth mask.
        if (state.depth_test == dev::DepthTest::Disabled)
        {
            GL_CALL(glDisable(GL_DEPTH_TEST));
        }
        else
        {
            GL_CALL(glEnable(GL_DEPTH_TEST));
            GL_CALL(glDepthFunc(GL_LEQUAL));
        }
        GL_CALL(glDepthMask(state.bWriteDepth ? GL_TRUE : GL_FALSE));
    }

    void Draw(dev::DrawType draw_primitive, unsigned vertex_start_index,
              unsigned vertex_draw_count, unsigned instance_count) const override
    {
        ASSERT(draw_primitive == dev::DrawType::Triangles);
        GL_CALL(glDrawArraysInstanced(GL_TRIANGLES, vertex_start_index, vertex_draw_count, instance_count));
    }

    void Draw(dev::DrawType draw_primitive, unsigned vertex_start_index, unsigned vertex_draw_count) const override
    {
        ASSERT(draw_primitive == dev::DrawType::Triangles);
        GL_CALL(glDrawArrays(GL_TRIANGLES, vertex_start_index, vertex_draw_count));
    }

    void ClearColorDepth(const glm::vec4& color, float depth) const override
    {
        GL_CALL(glBindFramebuffer(GL_FRAMEBUFFER, 0));
        // the depth clear is masked by the depth write mask.
        GL_CALL(glDepthMask(GL_TRUE));
        GL_CALL(glClearColor(color.r, color.g, color.b, color.a));
        GL_CALL(glClearDepthf(depth));
        GL_CALL(glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT));
    }

    void ReadColor(unsigned width, unsigned height, const dev::Framebuffer& fbo,
                   dev::ColorAttachment attachment, void* color_data) const override
    {
        BindFramebuffer(fbo);
        if (fbo.IsCustom())
        {
            GL_CALL(glReadBuffer(GL_COLOR_ATTACHMENT0 + static_cast<GLenum>(attachment)));
        }
        GL_CALL(glReadPixels(0, 0, width, height, GL_RGBA, GL_UNSIGNED_BYTE, color_data));
    }

    void GetDeviceCaps(dev::GraphicsDeviceCaps* caps) const override
    {
        caps->num_texture_units = mTextureUnitCount;
        caps->num_color_attachments = mColorAttachmentCount;
        caps->max_fbo_height = mMaxTextureSize;
        caps->max_fbo_width  = mMaxTextureSize;
        caps->instanced_rendering = true;
        caps->multiple_color_attachments = mColorAttachmentCount > 1;
    }

    void BeginFrame() override
    {
        // "orphan" the streaming vertex buffers by re-specifying
        // the contents of the buffer with a nullptr data upload.
        // https://www.khronos.org/opengl/wiki/Buffer_Object_Streaming
        for (auto& buff: mVertexBuffers)
        {
            if (buff.usage == dev::BufferUsage::Stream)
            {
                GL_CALL(glBindBuffer(GL_ARRAY_BUFFER, buff.name));
                GL_CALL(glBufferData(GL_ARRAY_BUFFER, buff.capacity, nullptr, GL_STREAM_DRAW));
                buff.offset = 0;
            }
        }
    }

    void EndFrame(bool display) override
    {
        if (display)
            mContext->Display();
    }

    GraphicsDevice* AsGraphicsDevice() override
    {
        return this;
    }

    std::shared_ptr<GraphicsDevice> GetSharedGraphicsDevice() override
    {
        return shared_from_this();
    }
};

} // namespace

namespace dev {

std::shared_ptr<Device> CreateDevice(std::shared_ptr<dev::Context> context)
{
    ASSERT(context->GetVersion() == Context::Version::OpenGL_ES3);
    return std::make_shared<OpenGLES3GraphicsDevice>(std::move(context));
}
std::shared_ptr<Device> CreateDevice(dev::Context* context)
{
    ASSERT(context->GetVersion() == Context::Version::OpenGL_ES3);
    return std::make_shared<OpenGLES3GraphicsDevice>(context);
}

} // namespace
