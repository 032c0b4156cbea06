#include "hmarshal/hmarshal.hpp"
#include "hmarshal/hmarshal_easy.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace hmarshal;

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

static Value make_payload(std::size_t rows, std::size_t cols) {
    std::vector<Value> fields;

    // Large double matrix
    {
        std::vector<double> v(rows * cols);
        std::mt19937_64 rng(123);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        for (auto& x : v) x = dist(rng);
        fields.push_back(Value::make_numeric(easy::make_numeric<double>({rows, cols}, v)));
    }

    // Large single matrix
    {
        std::vector<float> v(rows * cols);
        std::mt19937 rng(456);
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        for (auto& x : v) x = dist(rng);
        fields.push_back(Value::make_numeric(easy::make_numeric<float>({rows, cols}, v)));
    }

    // Many small nodes
    {
        ObjectArray grid;
        grid.shape = {20, 20};
        for (std::size_t i = 0; i < numel(grid.shape); ++i) {
            grid.elements.push_back(Value::make_collection(
                CollectionKind::List, {Value::make_int(static_cast<std::int64_t>(i)), Value::make_text(U"cell")}));
        }
        fields.push_back(Value::make_object_array(grid));
    }

    return Value::make_collection(CollectionKind::Tuple, std::move(fields));
}

static void bench_one(const std::filesystem::path& file, const char* label, const Options& opts) {
    std::size_t rows = 1200;
    std::size_t cols = 1200;
    Value root = make_payload(rows, cols);

    std::cout << "=== " << file.extension().string() << " " << label << " ===\n";
    std::filesystem::remove(file);

    auto t0 = std::chrono::high_resolution_clock::now();
    write(root, "/bench", file, opts);
    double w_ms = ms_since(t0);

    std::uintmax_t sz = std::filesystem::file_size(file);
    double mb = static_cast<double>(sz) / (1024.0 * 1024.0);

    std::cout << "write: " << w_ms << " ms, file=" << mb << " MiB, throughput=" << (mb / (w_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    Value back = read("/bench", file, opts);
    double r_ms = ms_since(t0);
    std::cout << "read : " << r_ms << " ms, throughput=" << (mb / (r_ms / 1000.0)) << " MiB/s\n";
    if (opts.regime() == Regime::Fidelity && !(back == root)) {
        std::cerr << "bench warning: read-back differs\n";
    }
}

int main(int argc, char** argv) {
    std::filesystem::path dir = (argc >= 2) ? argv[1] : std::filesystem::temp_directory_path();

    Options fidelity;
    Options matlab;
    matlab.store_type_information = false;
    Options bare;
    bare.store_type_information = false;
    bare.matlab_compatible = false;

    try {
        for (const char* name : {"hmarshal_bench.h5", "hmarshal_bench.mat"}) {
            std::filesystem::path file = dir / name;
            bench_one(file, "fidelity", fidelity);
            bench_one(file, "matlab", matlab);
            bench_one(file, "bare", bare);
            std::filesystem::remove(file);
        }
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
