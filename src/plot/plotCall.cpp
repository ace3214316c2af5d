// --- 文件路径: src/plot/plotCall.cpp ---
#include "pch.h"
#include "noteplot/plot/plotCall.h"
#include "noteplot/plot/plotDense.h"
#include "noteplot/plot/plotWarped.h"
#include "noteplot/plot/plotAdaptive.h"
#include "noteplot/plot/plotAssemble.h"
#include <oneapi/tbb/concurrent_queue.h>
#include <oneapi/tbb/parallel_for_each.h>
#include <numeric>

namespace NotePlot {

RawSequence sample(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                   SampleStats* stats) {
    if (!curve.fx) throw std::runtime_error("Curve has no function attached");
    if (curve.mode == CurveMode::Parametric && !curve.fy) {
        throw std::runtime_error("Parametric curve has no y(t) attached");
    }

    switch (config.strategy) {
        case SamplingStrategy::Dense:    return sample_dense(curve, domain, config, stats);
        case SamplingStrategy::Warped:   return sample_warped(curve, domain, config, stats);
        case SamplingStrategy::Adaptive: return sample_adaptive(curve, domain, config, stats);
    }
    throw std::runtime_error("Unknown sampling strategy");
}

namespace {

    struct IndexedResult {
        size_t index = 0;
        PlotResult result;
    };

    // =========================================================
    // 结果收集器 (ResultCollector)
    // 把各线程算出的结果按请求下标写回输出数组
    // =========================================================
    class ResultCollector {
    public:
        explicit ResultCollector(std::vector<PlotResult>& out) : m_out(out) {}

        void Flush(oneapi::tbb::concurrent_bounded_queue<IndexedResult>& queue) {
            IndexedResult res;
            while (queue.try_pop(res)) {
                m_out[res.index] = std::move(res.result);
                m_flushed++;
            }
        }

        size_t flushed() const { return m_flushed; }

    private:
        std::vector<PlotResult>& m_out;
        size_t m_flushed = 0;
    };

    PlotResult run_request(const PlotRequest& req) {
        PlotResult res;
        res.name = req.name;
        try {
            res.raw = sample(req.curve, req.domain, req.config, &res.stats);
            res.polylines = assemble(res.raw);
        } catch (const std::runtime_error& e) {
            res.error = e.what();
            res.raw.clear();
            res.polylines.clear();
        }
        return res;
    }

    void log_result(const PlotRequest& req, const PlotResult& res, bool verbose) {
        if (!res.ok()) {
            std::cerr << "[Batch] '" << res.name << "' rejected: " << res.error << std::endl;
            return;
        }
        if (verbose) {
            std::cout << "[Batch] '" << res.name << "' " << curve_mode_name(req.curve.mode)
                      << "/" << strategy_name(req.config.strategy)
                      << ": points=" << count_points(res.raw)
                      << " polylines=" << res.polylines.size()
                      << " evals=" << res.stats.evaluations << std::endl;
        }
        if (res.stats.point_ceiling_hit) {
            std::cout << "[Batch] '" << res.name << "' stopped at point ceiling ("
                      << req.config.point_ceiling << ")" << std::endl;
        }
        if (res.stats.iteration_limit_hit) {
            std::cout << "[Batch] '" << res.name << "' stopped at iteration limit ("
                      << req.config.max_iterations << ")" << std::endl;
        }
        if (res.stats.time_budget_hit) {
            std::cout << "[Batch] '" << res.name << "' stopped at time budget ("
                      << req.config.time_budget_ms << " ms)" << std::endl;
        }
    }
}

std::vector<PlotResult> sample_batch(const std::vector<PlotRequest>& requests, bool verbose) {
    std::vector<PlotResult> results(requests.size());
    if (requests.empty()) return results;

    oneapi::tbb::concurrent_bounded_queue<IndexedResult> results_queue;
    results_queue.set_capacity(static_cast<std::ptrdiff_t>(requests.size()));
    ResultCollector collector(results);

    std::vector<size_t> order(requests.size());
    std::iota(order.begin(), order.end(), size_t{0});

    // 请求之间全员并行
    oneapi::tbb::parallel_for_each(order.begin(), order.end(), [&](size_t idx) {
        results_queue.push({idx, run_request(requests[idx])});
    });
    collector.Flush(results_queue);

    if (collector.flushed() != requests.size()) {
        throw std::runtime_error("Batch sampling lost results: expected " + std::to_string(requests.size()) +
                                 ", got " + std::to_string(collector.flushed()));
    }

    // 日志按请求顺序输出，避免多线程交错
    for (size_t i = 0; i < requests.size(); ++i) log_result(requests[i], results[i], verbose);
    return results;
}

} // namespace NotePlot
