#include <Rasterix.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using namespace std;
using namespace Rasterix;

static GpgpuProgram make_matmul(i32 m, i32 k, i32 n) {
    GpgpuProgram program;
    program.name = "MatMul";
    program.variable_names = {"A", "B"};
    program.output_shape = {m, n};
    program.user_code =
        "void run() {\n"
        "    int r = getOutputCoord(0);\n"
        "    int c = getOutputCoord(1);\n"
        "    float sum = 0.0;\n"
        "    for (int i = 0; i < " + to_string(k) + "; ++i) {\n"
        "        sum += getA(r, i) * getB(i, c);\n"
        "    }\n"
        "    setOutput(sum);\n"
        "}";
    return program;
}

static GpgpuProgram make_relu(i32 m, i32 n) {
    GpgpuProgram program;
    program.name = "Relu";
    program.variable_names = {"X"};
    program.output_shape = {m, n};
    program.user_code =
        "void run() {\n"
        "    float v = getX(getOutputCoord(0), getOutputCoord(1));\n"
        "    setOutput(isnan(v) ? NAN : max(v, 0.0));\n"
        "}";
    return program;
}

static TensorData make_matrix(GpgpuContext& context, i32 rows, i32 cols) {
    TextureData tex;
    tex.tex_shape = {rows, cols};
    tex.texture = context.create_matrix_texture(static_cast<u32>(rows), static_cast<u32>(cols), false);
    return TensorData::from_texture({rows, cols}, tex);
}

int main() {
    const i32 M = 64, K = 32, N = 48;
    
    Logger::init("matmul.log");
    VulkanContext context;
    ProgramCache cache(context);
    
    mt19937 rng(42);
    normal_distribution<float> dist(0.0f, 1.0f);
    vector<float> a_data(M * K), b_data(K * N);
    for (auto& v : a_data) v = dist(rng);
    for (auto& v : b_data) v = dist(rng);
    
    TensorData a = make_matrix(context, M, K);
    TensorData b = make_matrix(context, K, N);
    TensorData c = make_matrix(context, M, N);
    TensorData d = make_matrix(context, M, N);
    context.upload_matrix_texture(std::get<TextureData>(a.storage).texture, a_data);
    context.upload_matrix_texture(std::get<TextureData>(b.storage).texture, b_data);
    
    cache.compile_and_run(make_matmul(M, K, N), {a, b}, c);
    cache.compile_and_run(make_relu(M, N), {c}, d);
    
    vector<float> result = context.download_matrix_texture(std::get<TextureData>(d.storage).texture);
    
    float max_error = 0.0f;
    for (i32 r = 0; r < M; ++r) {
        for (i32 col = 0; col < N; ++col) {
            float sum = 0.0f;
            for (i32 i = 0; i < K; ++i) sum += a_data[r * K + i] * b_data[i * N + col];
            float expected = sum > 0.0f ? sum : 0.0f;
            max_error = max(max_error, abs(result[r * N + col] - expected));
        }
    }
    
    cout << "relu(A[" << M << "x" << K << "] * B[" << K << "x" << N << "])" << endl;
    cout << "  Device: " << context.device().properties.deviceName << endl;
    cout << "  Cached programs: " << cache.size() << endl;
    cout << "  Max abs error vs CPU: " << max_error << endl;
    cout << "  First row: ";
    for (i32 i = 0; i < 6; ++i) cout << result[i] << " ";
    cout << endl;
    
    for (TensorData* t : {&a, &b, &c, &d}) {
        context.delete_matrix_texture(std::get<TextureData>(t->storage).texture);
    }
    cache.clear();
    
    return max_error < 1e-3f ? 0 : 1;
}
