// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Path Circuit Benchmark
// Measures the homomorphic cost of path verification over growing grids.
//
// Measures:
//   - Oblivious cell lookup (gather) at N x N for each requested N
//   - Full path evaluation along the grid border, start (0,0) to (N-1,N-1)
//
// Usage:
//   ./pathcaptcha_bench [--params TOY] [--bits 4] [--sizes 2,3,4] [--iterations N] [--json]

#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>
#include <getopt.h>

#include "algebra/binfhe_algebra.h"
#include "verify/path_circuit.h"

using namespace lbcrypto;
using namespace lux::pathcaptcha;
using namespace std::chrono;

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string params = "TOY";
    std::string method = "GINX";
    uint32_t bits = 4;
    std::vector<uint32_t> sizes = {2, 3, 4};
    int iterations = 3;
    bool json_output = false;
    std::string output_file;
};

struct BenchResult {
    std::string name;
    uint32_t grid;
    double latency_ms;
    double std_dev;
    uint64_t gates;
    double ms_per_gate;

    std::string to_json() const {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(6);
        ss << "    {\n";
        ss << "      \"name\": \"" << name << "\",\n";
        ss << "      \"grid\": " << grid << ",\n";
        ss << "      \"latency_ms\": " << latency_ms << ",\n";
        ss << "      \"std_dev\": " << std_dev << ",\n";
        ss << "      \"gates\": " << gates << ",\n";
        ss << "      \"ms_per_gate\": " << ms_per_gate << "\n";
        ss << "    }";
        return ss.str();
    }
};

std::vector<BenchResult> g_results;

// ============================================================================
// Timing Utilities
// ============================================================================

// Returns {mean ms, std dev ms, gates per call}
template<typename Func>
std::tuple<double, double, uint64_t> time_circuit(algebra::CiphertextAlgebra& alg,
                                                  Func&& func, int iterations) {
    std::vector<double> samples;
    samples.reserve(iterations);
    uint64_t gates = 0;

    for (int i = 0; i < iterations; i++) {
        uint64_t before = alg.GateCount();
        auto start = high_resolution_clock::now();
        func();
        auto end = high_resolution_clock::now();
        gates = alg.GateCount() - before;
        samples.push_back(duration<double, std::milli>(end - start).count());
    }

    double sum = 0.0;
    for (double s : samples) sum += s;
    double mean = sum / iterations;

    double var_sum = 0.0;
    for (double s : samples) {
        var_sum += (s - mean) * (s - mean);
    }
    return {mean, std::sqrt(var_sum / iterations), gates};
}

void print_header(const std::string& title) {
    std::cout << "\n=== " << title << " ===\n";
    std::cout << std::left << std::setw(28) << "Benchmark"
              << std::right << std::setw(8) << "Grid"
              << std::setw(14) << "Latency"
              << std::setw(10) << "Gates"
              << std::setw(14) << "Per gate" << "\n";
}

void print_result(const BenchResult& r) {
    std::cout << std::left << std::setw(28) << r.name
              << std::right << std::setw(5) << r.grid << "x" << std::left << std::setw(2) << r.grid
              << std::right << std::fixed << std::setprecision(3)
              << std::setw(11) << r.latency_ms << " ms"
              << std::setw(10) << r.gates
              << std::setw(11) << r.ms_per_gate << " ms" << std::endl;
}

void record(const std::string& name, uint32_t grid,
            const std::tuple<double, double, uint64_t>& timing) {
    BenchResult r;
    r.name = name;
    r.grid = grid;
    r.latency_ms = std::get<0>(timing);
    r.std_dev = std::get<1>(timing);
    r.gates = std::get<2>(timing);
    r.ms_per_gate = r.gates > 0 ? r.latency_ms / r.gates : 0.0;
    print_result(r);
    g_results.push_back(r);
}

// ============================================================================
// Fixtures
// ============================================================================

class Encryptor {
  public:
    Encryptor(algebra::BinFheAlgebra& alg, const LWEPrivateKey& sk, uint32_t bits)
        : alg_(alg), sk_(sk), bits_(bits) {}

    EncryptedCoord coord(uint64_t row, uint64_t col) const {
        return EncryptedCoord{alg_.EncryptWord(sk_, row, bits_), alg_.EncryptWord(sk_, col, bits_)};
    }

    // Open n x n maze from (0,0) to (n-1,n-1)
    EncryptedMaze openMaze(uint32_t n) const {
        EncryptedMaze maze;
        maze.id = 1;
        maze.rows = n;
        maze.cols = n;
        for (uint32_t i = 0; i < n * n; i++) {
            maze.grid.push_back(alg_.EncryptBit(sk_, false));
        }
        maze.start = coord(0, 0);
        maze.end = coord(n - 1, n - 1);
        return maze;
    }

    // Down the first column, then along the last row
    std::vector<EncryptedCoord> borderPath(uint32_t n) const {
        std::vector<EncryptedCoord> path;
        for (uint32_t r = 0; r < n; r++) path.push_back(coord(r, 0));
        for (uint32_t c = 1; c < n; c++) path.push_back(coord(n - 1, c));
        return path;
    }

  private:
    algebra::BinFheAlgebra& alg_;
    const LWEPrivateKey& sk_;
    uint32_t bits_;
};

// ============================================================================
// Benchmarks
// ============================================================================

void benchmark_gather(algebra::BinFheAlgebra& alg, const Encryptor& enc, const Config& config) {
    print_header("Oblivious Cell Lookup");
    for (uint32_t n : config.sizes) {
        EncryptedMaze maze = enc.openMaze(n);
        EncryptedCoord at = enc.coord(n / 2, n / 2);
        verify::PathCircuit circuit(alg, maze);
        record("cell_is_open", n,
               time_circuit(alg, [&] { circuit.CellIsOpen(at); }, config.iterations));
    }
}

void benchmark_evaluate(algebra::BinFheAlgebra& alg, const Encryptor& enc, const Config& config) {
    print_header("Full Path Evaluation");
    for (uint32_t n : config.sizes) {
        EncryptedMaze maze = enc.openMaze(n);
        auto path = enc.borderPath(n);
        verify::PathCircuit circuit(alg, maze);
        record("evaluate_border_path", n,
               time_circuit(alg, [&] { circuit.Evaluate(path); }, config.iterations));
    }
}

// ============================================================================
// Output
// ============================================================================

void output_json(const Config& config) {
    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"params\": \"" << config.params << "\",\n";
    ss << "  \"method\": \"" << config.method << "\",\n";
    ss << "  \"coordinate_bits\": " << config.bits << ",\n";
    ss << "  \"results\": [\n";
    for (size_t i = 0; i < g_results.size(); i++) {
        ss << g_results[i].to_json();
        if (i + 1 < g_results.size()) ss << ",";
        ss << "\n";
    }
    ss << "  ]\n";
    ss << "}\n";

    if (config.output_file.empty()) {
        std::cout << "\n=== JSON Output ===\n" << ss.str();
    } else {
        std::ofstream out(config.output_file);
        out << ss.str();
        std::cout << "\nJSON written to: " << config.output_file << "\n";
    }
}

// ============================================================================
// Main
// ============================================================================

std::vector<uint32_t> parse_sizes(const std::string& list) {
    std::vector<uint32_t> sizes;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        sizes.push_back(static_cast<uint32_t>(std::stoul(item)));
    }
    return sizes;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --params NAME    BinFHE parameter set (default: TOY)\n";
    std::cout << "  --method NAME    Bootstrapping method (default: GINX)\n";
    std::cout << "  --bits N         Coordinate width (default: 4)\n";
    std::cout << "  --sizes LIST     Comma-separated grid sides (default: 2,3,4)\n";
    std::cout << "  --iterations N   Samples per benchmark (default: 3)\n";
    std::cout << "  --json           Output results in JSON format\n";
    std::cout << "  --output FILE    Write JSON to FILE\n";
    std::cout << "  --help           Show this help message\n";
}

int main(int argc, char* argv[]) {
    Config config;

    static struct option long_options[] = {
        {"params", required_argument, nullptr, 'p'},
        {"method", required_argument, nullptr, 'm'},
        {"bits", required_argument, nullptr, 'b'},
        {"sizes", required_argument, nullptr, 's'},
        {"iterations", required_argument, nullptr, 'n'},
        {"json", no_argument, nullptr, 'j'},
        {"output", required_argument, nullptr, 'o'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, "p:m:b:s:n:jo:h", long_options, nullptr)) != -1) {
            switch (opt) {
                case 'p':
                    config.params = optarg;
                    break;
                case 'm':
                    config.method = optarg;
                    break;
                case 'b':
                    config.bits = static_cast<uint32_t>(std::stoul(optarg));
                    break;
                case 's':
                    config.sizes = parse_sizes(optarg);
                    break;
                case 'n':
                    config.iterations = std::stoi(optarg);
                    break;
                case 'j':
                    config.json_output = true;
                    break;
                case 'o':
                    config.output_file = optarg;
                    config.json_output = true;
                    break;
                case 'h':
                    print_usage(argv[0]);
                    return 0;
                default:
                    print_usage(argv[0]);
                    return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        return 1;
    }

    if (config.iterations <= 0) {
        std::cerr << "--iterations must be positive\n";
        return 1;
    }
    if (config.bits == 0 || config.bits > 16) {
        std::cerr << "--bits must be in 1..16\n";
        return 1;
    }
    for (uint32_t n : config.sizes) {
        if (n == 0 || n >= (1u << config.bits)) {
            std::cerr << "Grid side " << n << " does not fit " << config.bits << "-bit coordinates\n";
            return 1;
        }
    }

    std::cout << "========================================\n";
    std::cout << "  PathCaptcha Circuit Benchmark\n";
    std::cout << "========================================\n";
    std::cout << "\nConfiguration:\n";
    std::cout << "  Parameters: " << config.params << " / " << config.method << "\n";
    std::cout << "  Coordinate bits: " << config.bits << "\n";
    std::cout << "  Iterations: " << config.iterations << "\n";

    try {
        auto start = high_resolution_clock::now();
        algebra::BinFheAlgebra alg(algebra::ParamSetFromName(config.params),
                                   algebra::MethodFromName(config.method));
        auto sk = alg.GetContext().KeyGen();
        alg.GetContext().BTKeyGen(sk);
        auto setup = duration_cast<milliseconds>(high_resolution_clock::now() - start).count();
        std::cout << "  Setup + keygen: " << setup << " ms\n";

        Encryptor enc(alg, sk, config.bits);
        benchmark_gather(alg, enc, config);
        benchmark_evaluate(alg, enc, config);
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << "\n";
        return 1;
    }

    if (config.json_output) {
        output_json(config);
    }
    return 0;
}
