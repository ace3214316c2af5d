#include "pch.h"
#include "noteplot/plot/plotCall.h"
#include "noteplot/io/JsonAdapter.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <iomanip>

namespace {

    std::string read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Could not open " + path + " for reading.");
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // points.txt 风格的调试输出: 每个点一行 [X] [Y] [Plot_ID] [Polyline_ID]
    void write_points_text(const std::string& path, const std::vector<NotePlot::PlotResult>& results) {
        std::ofstream outfile(path);
        if (!outfile.is_open()) {
            throw std::runtime_error("Could not open " + path + " for writing.");
        }

        size_t total = 0;
        for (const auto& r : results) {
            for (const auto& line : r.polylines) total += line.size();
        }

        outfile << "# NotePlot Debug Result\n";
        outfile << "# Plots: " << results.size() << "\n";
        outfile << "# Total points: " << total << "\n";
        outfile << "# [X] [Y] [Plot_ID] [Polyline_ID]\n";
        outfile << std::fixed << std::setprecision(6);

        for (size_t i = 0; i < results.size(); ++i) {
            const auto& r = results[i];
            if (!r.ok()) {
                outfile << "# plot " << i << " (" << r.name << ") rejected: " << r.error << "\n";
                continue;
            }
            for (size_t k = 0; k < r.polylines.size(); ++k) {
                for (const auto& pt : r.polylines[k]) {
                    outfile << pt.x << " " << pt.y << " " << i << " " << k << "\n";
                }
            }
        }
    }

    void write_text(const std::string& path, const std::string& content) {
        std::ofstream outfile(path);
        if (!outfile.is_open()) {
            throw std::runtime_error("Could not open " + path + " for writing.");
        }
        outfile << content << "\n";
    }
}

int main(int argc, char** argv) {
    try {
        // =========================================================
        // 1. 命令行参数
        // =========================================================
        std::vector<std::string> args;
        bool verbose = false;
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "-v" || a == "--verbose") verbose = true;
            else args.push_back(a);
        }
        if (args.empty() || args.size() > 2) {
            std::cerr << "Usage: noteplot_cli [-v] <scene.json> [out.json|out.txt]" << std::endl;
            return 2;
        }
        const std::string scene_path = args[0];
        const std::string out_path = args.size() > 1 ? args[1] : "points.json";

        // =========================================================
        // 2. 解析场景
        // =========================================================
        std::vector<NotePlot::PlotRequest> requests = NotePlot::JsonAdapter::parse_scene(read_file(scene_path));
        std::cout << "[Scene] Loaded " << requests.size() << " plot(s) from " << scene_path << std::endl;

        // =========================================================
        // 3. 批量采样
        // =========================================================
        std::cout << "--- Starting Sampling ---" << std::endl;
        auto start_time = std::chrono::high_resolution_clock::now();

        std::vector<NotePlot::PlotResult> results = NotePlot::sample_batch(requests, verbose);

        auto end_time = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> ms_double = end_time - start_time;
        std::cout << "采样总耗时: " << std::fixed << std::setprecision(4)
                  << ms_double.count() << " ms" << std::endl;

        // =========================================================
        // 4. 导出
        // =========================================================
        if (ends_with(out_path, ".txt")) {
            write_points_text(out_path, results);
        } else {
            write_text(out_path, NotePlot::JsonAdapter::results_to_json(results));
        }

        size_t rejected = 0;
        for (size_t i = 0; i < results.size(); ++i) {
            const auto& r = results[i];
            if (!r.ok()) {
                rejected++;
                continue;
            }
            size_t pts = 0;
            for (const auto& line : r.polylines) pts += line.size();
            std::cout << "Plot " << std::setw(2) << i << " " << std::setw(18) << std::left << r.name << std::right
                      << ": Polylines=" << std::setw(4) << r.polylines.size()
                      << ", Points=" << std::setw(6) << pts << std::endl;
        }
        std::cout << "Results saved to " << out_path << std::endl;

        if (rejected > 0) {
            std::cerr << rejected << " plot(s) rejected." << std::endl;
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Critical Error: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
