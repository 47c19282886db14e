#include <Rasterix.h>
#include "RecordingContext.h"
#include <cmath>
#include <iostream>

using namespace Rasterix;

static GpgpuProgram make_unary_op(const std::string& name, Shape output_shape) {
    GpgpuProgram program;
    program.name = name;
    program.variable_names = {"A"};
    program.output_shape = std::move(output_shape);
    program.user_code = "void run() { setOutput(getA(getOutputCoord(0), 0, getOutputCoord(1))); }";
    return program;
}

static bool test_logical_shape_mismatch() {
    std::cout << "[test_logical_shape_mismatch]\n";
    
    RecordingContext context;
    TensorData a = make_texture_operand(context, {2, 3}, {2, 3});
    TensorData out = make_texture_operand(context, {2, 3}, {2, 3});
    
    GpgpuProgram program;
    program.name = "Copy";
    program.variable_names = {"A"};
    program.output_shape = {2, 3};
    program.user_code = "void run() { setOutput(getA(getOutputCoord(0), getOutputCoord(1))); }";
    
    auto binary = compile_program(context, program, {a}, out);
    context.clear_calls();
    
    TensorData wrong = make_texture_operand(context, {3, 2}, {2, 3});
    try {
        run_program(context, *binary, {wrong}, out);
        std::cerr << "  FAIL: mismatched logical shape accepted\n";
        return false;
    } catch (const ShapeMismatchError& e) {
        std::string message = e.what();
        if (message.find("[2,3] and [3,2]") == std::string::npos) {
            std::cerr << "  FAIL: unexpected message: " << message << "\n";
            return false;
        }
    }
    
    if (context.executions() != 0 || !context.calls().empty()) {
        std::cerr << "  FAIL: context touched after a failed validation\n";
        return false;
    }
    
    try {
        run_program(context, *binary, {a, a}, out);
        std::cerr << "  FAIL: extra input accepted\n";
        return false;
    } catch (const ShapeMismatchError&) {
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_tex_shape_mismatch() {
    std::cout << "[test_tex_shape_mismatch]\n";
    
    RecordingContext context;
    TensorData a = make_texture_operand(context, {2, 3}, {2, 3});
    TensorData out = make_texture_operand(context, {2, 3}, {2, 3});
    
    GpgpuProgram program;
    program.name = "Copy";
    program.variable_names = {"A"};
    program.output_shape = {2, 3};
    program.user_code = "void run() { setOutput(getA(getOutputCoord(0), getOutputCoord(1))); }";
    
    auto binary = compile_program(context, program, {a}, out);
    
    TensorData flat = make_texture_operand(context, {2, 3}, {1, 6});
    TensorData uniform = TensorData::from_uniform({2, 3}, {1, 2, 3, 4, 5, 6});
    
    for (const TensorData& operand : {flat, uniform}) {
        try {
            run_program(context, *binary, {operand}, out);
            std::cerr << "  FAIL: differing texture layout accepted\n";
            return false;
        } catch (const ShapeMismatchError&) {
        }
    }
    
    // Mismatched output layouts are rejected the same way.
    TensorData flat_out = make_texture_operand(context, {2, 3}, {1, 6});
    try {
        run_program(context, *binary, {a}, flat_out);
        std::cerr << "  FAIL: differing output layout accepted\n";
        return false;
    } catch (const ShapeMismatchError&) {
    }
    
    if (context.executions() != 0) {
        std::cerr << "  FAIL: program dispatched after a failed validation\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_uniform_operands_validate_by_shape() {
    std::cout << "[test_uniform_operands_validate_by_shape]\n";
    
    std::vector<ShapeInfo> infos(1);
    infos[0].logical_shape = {4};
    infos[0].is_uniform = true;
    
    try {
        validate_binary_and_program(infos, {TensorData::from_uniform({4}, {9, 8, 7, 6})});
    } catch (const ShapeMismatchError& e) {
        std::cerr << "  FAIL: uniform operands of equal shape rejected: " << e.what() << "\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_uniform_uploads() {
    std::cout << "[test_uniform_uploads]\n";
    
    RecordingContext context;
    GpgpuProgram program;
    program.name = "Scale";
    program.variable_names = {"X", "S"};
    program.output_shape = {1, 4};
    program.user_code = "void run() { setOutput(getX(0, getOutputCoord(1)) * getS(0, 0)); }";
    
    TensorData x = TensorData::from_uniform({1, 4}, {1, 2, 3, 4});
    TensorData s = TensorData::from_uniform({1, 1}, {7});
    TensorData out = make_texture_operand(context, {1, 4}, {1, 4});
    
    auto binary = compile_program(context, program, {x, s}, out);
    context.clear_calls();
    run_program(context, *binary, {x, s}, out);
    
    if (!context.has_call("uniform1fv X") || context.floats("X") != std::vector<f32>{1, 2, 3, 4}) {
        std::cerr << "  FAIL: [1,4] uniform not uploaded as a vector\n";
        return false;
    }
    if (!context.has_call("uniform1f S") || context.floats("S") != std::vector<f32>{7}) {
        std::cerr << "  FAIL: [1,1] uniform not uploaded as a scalar\n";
        return false;
    }
    if (context.executions() != 1) {
        std::cerr << "  FAIL: program not dispatched exactly once\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_short_uniform_rejected() {
    std::cout << "[test_short_uniform_rejected]\n";
    
    RecordingContext context;
    GpgpuProgram program;
    program.name = "AddMatrix";
    program.variable_names = {"A", "B"};
    program.output_shape = {2, 2};
    program.user_code = "void run() { setOutput(getA(getOutputCoord(0), getOutputCoord(1)) + "
                        "getB(getOutputCoord(0), getOutputCoord(1))); }";
    
    TensorData a = make_texture_operand(context, {2, 2}, {2, 2});
    TensorData b = TensorData::from_uniform({2, 2}, {1, 2, 3, 4});
    TensorData out = make_texture_operand(context, {2, 2}, {2, 2});
    auto binary = compile_program(context, program, {a, b}, out);
    
    TensorData short_b = TensorData::from_uniform({2, 2}, {1});
    try {
        run_program(context, *binary, {a, short_b}, out);
        std::cerr << "  FAIL: one value accepted for a [2,2] uniform\n";
        return false;
    } catch (const std::runtime_error&) {
    }
    if (context.executions() != 0 || context.has_floats("B")) {
        std::cerr << "  FAIL: short uniform reached the context\n";
        return false;
    }
    
    run_program(context, *binary, {a, b}, out);
    if (context.executions() != 1 || context.floats("B") != std::vector<f32>{1, 2, 3, 4}) {
        std::cerr << "  FAIL: full uniform not uploaded\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_texture_layout_uploads() {
    std::cout << "[test_texture_layout_uploads]\n";
    
    RecordingContext context;
    TensorData a = make_texture_operand(context, {2, 1, 6}, {2, 6});
    TensorData out = make_texture_operand(context, {2, 6}, {2, 6});
    
    auto binary = compile_program(context, make_unary_op("Squeeze", {2, 6}), {a}, out);
    context.clear_calls();
    run_program(context, *binary, {a}, out);
    
    if (context.ints("shapeA") != std::vector<i32>{2, 6}) {
        std::cerr << "  FAIL: shapeA is not the squeezed shape\n";
        return false;
    }
    if (context.ints("stridesA") != std::vector<i32>{6}) {
        std::cerr << "  FAIL: stridesA should be [6]\n";
        return false;
    }
    if (context.ints("texShapeA") != std::vector<i32>{2, 6}) {
        std::cerr << "  FAIL: texShapeA not uploaded\n";
        return false;
    }
    if (context.ints("outputShape") != std::vector<i32>{2, 6} ||
        context.ints("outputStrides") != std::vector<i32>{6} ||
        context.ints("outputTexShape") != std::vector<i32>{2, 6}) {
        std::cerr << "  FAIL: output layout uniforms not uploaded\n";
        return false;
    }
    if (context.has_ints("offsetA")) {
        std::cerr << "  FAIL: offset uploaded for an unsliced texture\n";
        return false;
    }
    if (!context.has_call("set_input_matrix_texture A unit 0") ||
        !context.has_call("set_output_matrix_texture 2x6")) {
        std::cerr << "  FAIL: textures not bound\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_sliced_texture_uploads_offset() {
    std::cout << "[test_sliced_texture_uploads_offset]\n";
    
    RecordingContext context;
    TensorData a = make_texture_operand(context, {2, 1, 6}, {4, 6}, false, 12);
    TensorData out = make_texture_operand(context, {2, 6}, {2, 6});
    
    auto binary = compile_program(context, make_unary_op("SliceCopy", {2, 6}), {a}, out);
    run_program(context, *binary, {a}, out);
    
    if (!context.has_ints("offsetA") || context.ints("offsetA") != std::vector<i32>{12}) {
        std::cerr << "  FAIL: slice offset not uploaded\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_special_values() {
    std::cout << "[test_special_values]\n";
    
    RecordingContext legacy(LEGACY_SHADER_API_VERSION);
    TensorData a = make_texture_operand(legacy, {2, 1, 6}, {2, 6});
    TensorData out = make_texture_operand(legacy, {2, 6}, {2, 6});
    
    auto binary = compile_program(legacy, make_unary_op("Copy", {2, 6}), {a}, out);
    run_program(legacy, *binary, {a}, out);
    
    if (!legacy.has_floats("NAN") || !std::isnan(legacy.floats("NAN")[0])) {
        std::cerr << "  FAIL: NAN not uploaded\n";
        return false;
    }
    if (!legacy.has_floats("INFINITY") || !std::isinf(legacy.floats("INFINITY")[0])) {
        std::cerr << "  FAIL: INFINITY not uploaded on the legacy dialect\n";
        return false;
    }
    if (legacy.index_of("uniform1f INFINITY") > legacy.index_of("uniform1f NAN")) {
        std::cerr << "  FAIL: INFINITY must be uploaded before NAN\n";
        return false;
    }
    
    RecordingContext modern;
    TensorData b = make_texture_operand(modern, {2, 1, 6}, {2, 6});
    TensorData out2 = make_texture_operand(modern, {2, 6}, {2, 6});
    auto modern_binary = compile_program(modern, make_unary_op("Copy", {2, 6}), {b}, out2);
    run_program(modern, *modern_binary, {b}, out2);
    if (modern.has_floats("INFINITY")) {
        std::cerr << "  FAIL: INFINITY uploaded on the modern dialect\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_custom_setup_runs_last() {
    std::cout << "[test_custom_setup_runs_last]\n";
    
    RecordingContext context;
    TensorData a = make_texture_operand(context, {2, 1, 6}, {2, 6});
    TensorData out = make_texture_operand(context, {2, 6}, {2, 6});
    
    auto binary = compile_program(context, make_unary_op("Copy", {2, 6}), {a}, out);
    context.clear_calls();
    
    bool called = false;
    run_program(context, *binary, {a}, out, [&](GpgpuContext& ctx, const ProgramHandle& handle) {
        called = handle == binary->handle();
        std::optional<UniformLocation> location = ctx.get_uniform_location(handle, "outputTexShape", true);
        ctx.uniform1iv(*location, {99, 99});
        ctx.uniform1f(*binary->nan_location(), 0.0f);
    });
    
    if (!called) {
        std::cerr << "  FAIL: hook not called with the program handle\n";
        return false;
    }
    if (context.ints("outputTexShape") != std::vector<i32>{99, 99} || context.floats("NAN")[0] != 0.0f) {
        std::cerr << "  FAIL: hook values were overwritten\n";
        return false;
    }
    
    const auto& calls = context.calls();
    if (calls.empty() || calls.back() != "execute_program") {
        std::cerr << "  FAIL: dispatch is not the last call\n";
        return false;
    }
    if (calls[calls.size() - 2] != "uniform1f NAN") {
        std::cerr << "  FAIL: hook did not run right before the dispatch\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_packed_output_binding() {
    std::cout << "[test_packed_output_binding]\n";
    
    RecordingContext context;
    GpgpuProgram program;
    program.name = "PackedCopy";
    program.variable_names = {"A"};
    program.output_shape = {3, 5};
    program.uses_packed_textures = true;
    program.user_code = "void run() { setOutput(getA(getOutputCoord(0), getOutputCoord(1))); }";
    
    TensorData a = make_texture_operand(context, {3, 5}, {3, 5}, true);
    TensorData out = make_texture_operand(context, {3, 5}, {3, 5}, true);
    
    auto binary = compile_program(context, program, {a}, out);
    context.clear_calls();
    run_program(context, *binary, {a}, out);
    
    if (!context.has_call("set_output_packed_matrix_texture 3x5") ||
        context.has_call("set_output_matrix_texture 3x5")) {
        std::cerr << "  FAIL: packed output not bound as packed\n";
        return false;
    }
    if (context.ints("shapeA") != std::vector<i32>{2, 3} || context.ints("stridesA") != std::vector<i32>{3}) {
        std::cerr << "  FAIL: packed input layout should use the packed shape\n";
        return false;
    }
    if (context.ints("packedTexShapeA") != std::vector<i32>{2, 3} ||
        context.ints("outputPackedTexShape") != std::vector<i32>{2, 3}) {
        std::cerr << "  FAIL: packed texture shapes not uploaded\n";
        return false;
    }
    if (context.ints("outputTexelsInLogicalRow") != std::vector<i32>{3} ||
        context.ints("outputTexelsInBatch") != std::vector<i32>{6}) {
        std::cerr << "  FAIL: output texel counts wrong\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_released_binary_rejected() {
    std::cout << "[test_released_binary_rejected]\n";
    
    RecordingContext context;
    GpgpuProgram program;
    program.name = "Copy";
    program.variable_names = {"A"};
    program.output_shape = {2, 2};
    program.user_code = "void run() { setOutput(getA(getOutputCoord(0), getOutputCoord(1))); }";
    
    TensorData a = make_texture_operand(context, {2, 2}, {2, 2});
    TensorData out = make_texture_operand(context, {2, 2}, {2, 2});
    auto binary = compile_program(context, program, {a}, out);
    GpgpuBinary moved = std::move(*binary);
    
    try {
        run_program(context, *binary, {a}, out);
        std::cerr << "  FAIL: moved-from binary was executed\n";
        return false;
    } catch (const std::runtime_error&) {
    }
    if (context.executions() != 0) {
        std::cerr << "  FAIL: moved-from binary reached the context\n";
        return false;
    }
    
    run_program(context, moved, {a}, out);
    if (context.executions() != 1) {
        std::cerr << "  FAIL: moved binary did not run\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

static bool test_packed_batch_uploads() {
    std::cout << "[test_packed_batch_uploads]\n";
    
    RecordingContext context;
    GpgpuProgram program;
    program.name = "PackedBatchCopy";
    program.variable_names = {"A"};
    program.output_shape = {2, 3, 5};
    program.uses_packed_textures = true;
    program.user_code =
        "void run() {\n"
        "    int texel = getOutputCoord(0) * texelsInBatchA + (getOutputCoord(1) / 2) * valuesPerRowA;\n"
        "    setOutput(getA(getOutputCoord(0), getOutputCoord(1), getOutputCoord(2)));\n"
        "}";
    
    TensorData a = make_texture_operand(context, {2, 3, 5}, {6, 5}, true);
    TensorData out = make_texture_operand(context, {2, 3, 5}, {6, 5}, true);
    auto binary = compile_program(context, program, {a}, out);
    run_program(context, *binary, {a}, out);
    
    if (context.ints("shapeA") != std::vector<i32>{2, 2, 3}) {
        std::cerr << "  FAIL: shapeA should be the packed shape [2,2,3]\n";
        return false;
    }
    if (!context.has_call("uniform1i valuesPerRowA") || context.ints("valuesPerRowA") != std::vector<i32>{2}) {
        std::cerr << "  FAIL: valuesPerRowA should be 2\n";
        return false;
    }
    if (!context.has_call("uniform1i texelsInBatchA") || context.ints("texelsInBatchA") != std::vector<i32>{2}) {
        std::cerr << "  FAIL: texelsInBatchA should be 2\n";
        return false;
    }
    
    std::cout << "  OK\n";
    return true;
}

int main() {
    std::cout << "=== Program Runner Tests ===\n\n";

    // Failing-path tests trip RX_ASSERT on purpose; keep the console quiet.
    LoggerConfig log_config;
    log_config.log_file.clear();
    log_config.console_level = spdlog::level::off;
    Logger::init(log_config);
    
    bool all_passed = true;
    
    all_passed &= test_logical_shape_mismatch();
    all_passed &= test_tex_shape_mismatch();
    all_passed &= test_uniform_operands_validate_by_shape();
    all_passed &= test_uniform_uploads();
    all_passed &= test_short_uniform_rejected();
    all_passed &= test_texture_layout_uploads();
    all_passed &= test_sliced_texture_uploads_offset();
    all_passed &= test_special_values();
    all_passed &= test_custom_setup_runs_last();
    all_passed &= test_packed_output_binding();
    all_passed &= test_packed_batch_uploads();
    all_passed &= test_released_binary_rejected();
    
    std::cout << "\n=== Summary ===\n";
    if (all_passed) {
        std::cout << "All program runner tests PASSED\n";
        return 0;
    } else {
        std::cout << "Some program runner tests FAILED\n";
        return 1;
    }
}
