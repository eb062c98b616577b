#include "hostbridge/gl/shader_transpiler.h"
#include <cctype>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace hostbridge {
namespace gl {

namespace {

const std::unordered_map<std::string, std::string>& samplingNames() {
    static const std::unordered_map<std::string, std::string> names = {
        {"texture2D", "texture"},
        {"texture3D", "texture"},
        {"textureCube", "texture"},
        {"texture2DProj", "textureProj"},
        {"texture3DProj", "textureProj"},
        {"texture2DLod", "textureLod"},
        {"texture3DLod", "textureLod"},
        {"textureCubeLod", "textureLod"},
        {"texture2DProjLod", "textureProjLod"},
        {"texture3DProjLod", "textureProjLod"},
        {"texture2DLodEXT", "textureLod"},
        {"texture2DProjLodEXT", "textureProjLod"},
        {"textureCubeLodEXT", "textureLod"},
        {"texture2DGradEXT", "textureGrad"},
        {"texture2DProjGradEXT", "textureProjGrad"},
        {"textureCubeGradEXT", "textureGrad"},
    };
    return names;
}

// Extensions whose functionality is core in GLSL ES 3.00
bool isCoreExtension(const std::string& name) {
    return name == "GL_OES_standard_derivatives" ||
           name == "GL_EXT_shader_texture_lod" ||
           name == "GL_EXT_draw_buffers" ||
           name == "GL_EXT_frag_depth";
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string trimLeft(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) i++;
    return line.substr(i);
}

// Tokens of a preprocessor line after the '#': "#  version 100" -> {"version", "100"}
std::vector<std::string> directiveTokens(const std::string& trimmed) {
    std::vector<std::string> tokens;
    std::string body = trimmed.substr(1);
    for (char& c : body) {
        if (c == ':') c = ' ';
    }
    std::istringstream in(body);
    std::string token;
    while (in >> token) tokens.push_back(token);
    return tokens;
}

struct Usage {
    bool fragColor = false;
    bool fragData = false;
};

std::string rewriteIdentifiers(const std::string& line, ShaderStage stage, Usage& usage) {
    const auto& sampling = samplingNames();
    std::string out;
    out.reserve(line.size());

    size_t i = 0;
    while (i < line.size()) {
        if (!isIdentStart(line[i])) {
            // Numbers like 1e5 must not start an identifier mid-token
            if (std::isdigit(static_cast<unsigned char>(line[i]))) {
                while (i < line.size() && isIdentChar(line[i])) out += line[i++];
            } else {
                out += line[i++];
            }
            continue;
        }

        size_t start = i;
        while (i < line.size() && isIdentChar(line[i])) i++;
        std::string ident = line.substr(start, i - start);

        if (ident == "attribute") {
            out += "in";
        } else if (ident == "varying") {
            out += stage == ShaderStage::Vertex ? "out" : "in";
        } else if (ident == "gl_FragColor") {
            usage.fragColor = true;
            out += kFragColorOutput;
        } else if (ident == "gl_FragData") {
            usage.fragData = true;
            out += kFragDataOutput;
        } else if (ident == "gl_FragDepthEXT") {
            out += "gl_FragDepth";
        } else {
            auto it = sampling.find(ident);
            out += it != sampling.end() ? it->second : ident;
        }
    }
    return out;
}

}  // namespace

std::string transpileShader(const std::string& source, ShaderStage stage, ShaderDialect target) {
    if (target != ShaderDialect::Glsl300es) {
        return source;
    }

    std::vector<std::string> lines;
    {
        std::string line;
        std::istringstream in(source);
        while (std::getline(in, line)) lines.push_back(line);
    }

    int versionLine = -1;
    for (size_t i = 0; i < lines.size(); i++) {
        std::string trimmed = trimLeft(lines[i]);
        if (trimmed.empty() || trimmed[0] != '#') continue;
        auto tokens = directiveTokens(trimmed);
        if (!tokens.empty() && tokens[0] == "version") {
            // Anything but GLSL ES 1.00 is already in its final dialect
            if (tokens.size() < 2 || tokens[1] != "100") {
                return source;
            }
            versionLine = static_cast<int>(i);
            break;
        }
    }

    Usage usage;
    std::vector<std::string> body;
    body.reserve(lines.size());
    size_t prefixCount = 0;  // body lines that sat above the version pragma
    for (size_t i = 0; i < lines.size(); i++) {
        if (static_cast<int>(i) == versionLine) continue;

        std::string trimmed = trimLeft(lines[i]);
        if (!trimmed.empty() && trimmed[0] == '#') {
            auto tokens = directiveTokens(trimmed);
            if (tokens.size() >= 2 && tokens[0] == "extension" && isCoreExtension(tokens[1])) {
                continue;
            }
        }
        body.push_back(rewriteIdentifiers(lines[i], stage, usage));
        if (static_cast<int>(i) < versionLine) prefixCount = body.size();
    }

    std::string out;
    out.reserve(source.size() + 96);
    // Lines before the version pragma (comments) stay above it
    for (size_t i = 0; i < prefixCount; i++) {
        out += body[i];
        out += '\n';
    }
    out += "#version 300 es\n";
    if (stage == ShaderStage::Fragment) {
        if (usage.fragColor) {
            out += "out mediump vec4 ";
            out += kFragColorOutput;
            out += ";\n";
        }
        if (usage.fragData) {
            out += "layout(location = 0) out mediump vec4 ";
            out += kFragDataOutput;
            out += "[4];\n";
        }
    }

    for (size_t i = prefixCount; i < body.size(); i++) {
        out += body[i];
        out += '\n';
    }
    return out;
}

}  // namespace gl
}  // namespace hostbridge
