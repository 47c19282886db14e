#include <Rasterix.h>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace Rasterix;

static UniformLayout reflect_compute(const std::string& declarations) {
    const std::string source =
        "#version 450\n"
        "layout(local_size_x = 1) in;\n" + declarations + "void main() {}\n";
    return UniformLayout::reflect(compile_glsl_to_spirv(source));
}

static bool test_std140_offsets() {
    std::cout << "[test_std140_offsets]\n";
    
    UniformLayout layout = reflect_compute(
        "layout(std140, set = 0, binding = 0) uniform Uniforms {\n"
        "    float NAN;\n"
        "    int shapeA[2];   // padded to vec4 per element\n"
        "    ivec2 texShapeA;\n"
        "    int offsetA;\n"
        "    float B[3];\n"
        "};\n");
    if (!layout.has_block() || layout.block_binding() != 0 || layout.members().size() != 5) {
        std::cerr << "  FAIL: uniform block not reflected\n";
        return false;
    }
    
    struct Expected { const char* name; u32 offset; u32 stride; };
    const Expected expected[] = {
        {"NAN", 0, 0},
        {"shapeA", 16, 16},
        {"texShapeA", 48, 0},
        {"offsetA", 56, 0},
        {"B", 64, 16}
    };
    for (const auto& e : expected) {
        std::optional<i32> location = layout.find(e.name);
        const UniformMember* member = location ? layout.member(*location) : nullptr;
        if (!member || member->offset != e.offset || member->array_stride != e.stride) {
            std::cerr << "  FAIL: " << e.name << " at offset "
                      << (member ? static_cast<i64>(member->offset) : -1) << ", expected " << e.offset << "\n";
            return false;
        }
    }
    
    if (layout.block_size() != 112) {
        std::cerr << "  FAIL: block size " << layout.block_size() << ", expected 112\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_storage_buffers() {
    std::cout << "[test_storage_buffers]\n";
    
    UniformLayout layout = reflect_compute(
        "layout(std430, set = 0, binding = 2) writeonly buffer resultTexels { vec4 result[]; };\n"
        "layout(std140, set = 0, binding = 0) uniform Uniforms {\n"
        "    float NAN;\n"
        "};\n"
        "layout(std430, set = 0, binding = 1) readonly buffer ATexels { vec4 A[]; };\n");
    if (layout.buffers().size() != 2) {
        std::cerr << "  FAIL: expected two storage buffers\n";
        return false;
    }
    
    std::optional<i32> a = layout.find("A");
    const StorageBufferDecl* decl = a ? layout.buffer(*a) : nullptr;
    if (!decl || decl->binding != 1 || !decl->readonly || !decl->vec4_texels || layout.member(*a) ||
        layout.buffers().front().binding != 1) {
        std::cerr << "  FAIL: input buffer not resolved\n";
        return false;
    }
    
    const StorageBufferDecl* output = layout.output_buffer();
    if (!output || output->name != "result" || output->binding != 2) {
        std::cerr << "  FAIL: output buffer not resolved\n";
        return false;
    }
    
    if (layout.find("shapeA")) {
        std::cerr << "  FAIL: undeclared name resolved\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_generated_source_reflects() {
    std::cout << "[test_generated_source_reflects]\n";
    
    ShapeInfo input;
    input.logical_shape = {2, 3, 4};
    input.tex_shape = TexShape{6, 4};
    ShapeInfo scalar;
    scalar.is_uniform = true;
    ShapeInfo output;
    output.logical_shape = {2, 3, 4};
    output.tex_shape = TexShape{6, 4};
    
    ShaderGen::ShaderSource shader = ShaderGen::make_shader(
        {{"A", input}, {"S", scalar}}, output,
        "void run() { setOutput(getA(getOutputCoord(0), getOutputCoord(1), getOutputCoord(2)) + getS()); }",
        false, LEGACY_SHADER_API_VERSION);
    
    UniformLayout layout = UniformLayout::reflect(compile_glsl_to_spirv(shader.source));
    const char* names[] = {"NAN", "INFINITY", "shapeA", "stridesA", "texShapeA", "S",
                           "outputShape", "outputStrides", "outputTexShape", "A", "result"};
    for (const char* name : names) {
        if (!layout.find(name)) {
            std::cerr << "  FAIL: '" << name << "' not found in the generated layout\n";
            return false;
        }
    }
    if (layout.find("S") && layout.buffer(*layout.find("S"))) {
        std::cerr << "  FAIL: uniform input resolved as a buffer\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_unsupported_member() {
    std::cout << "[test_unsupported_member]\n";
    
    const char* members[] = {"mat4 transform;", "uint count;", "vec4 color;"};
    for (const char* declaration : members) {
        try {
            reflect_compute(std::string("layout(std140, set = 0, binding = 0) uniform Uniforms {\n    ") +
                            declaration + "\n};\n");
            std::cerr << "  FAIL: '" << declaration << "' accepted\n";
            return false;
        } catch (const std::invalid_argument&) {
        }
    }
    
    std::cout << "  OK\n";
    return true;
}

int main() {
    std::cout << "=== Uniform Layout Tests ===\n\n";
    
    bool all_passed = true;
    
    all_passed &= test_std140_offsets();
    all_passed &= test_storage_buffers();
    all_passed &= test_generated_source_reflects();
    all_passed &= test_unsupported_member();
    
    std::cout << "\n=== Summary ===\n";
    if (all_passed) {
        std::cout << "All uniform layout tests PASSED\n";
        return 0;
    } else {
        std::cout << "Some uniform layout tests FAILED\n";
        return 1;
    }
}
