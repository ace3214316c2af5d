// --- 文件路径: include/noteplot/io/JsonAdapter.h ---

#ifndef NOTEPLOT_IO_JSON_ADAPTER_H
#define NOTEPLOT_IO_JSON_ADAPTER_H

#include "pch.h"
#include "noteplot/plot/plotCall.h"

namespace NotePlot::JsonAdapter {

    /**
     * @brief 解析场景 JSON (simdjson)。
     *
     * 格式:
     * {
     *   "render-sample-count": 5000,            // 可选，默认点数上限
     *   "defaults": { "strategy": "adaptive", "tolerance": 0.01, ... },
     *   "plots": [
     *     { "name": "f", "mode": "explicit",   "expr": "sin(pi/x)", "domain": [-1, 1] },
     *     { "mode": "parametric", "x": "cos(t)", "y": "sin(t)", "domain": [0, 6.283] },
     *     { "mode": "polar", "r": "1 + cos(theta)", "domain": [0, 6.283] },
     *     { "mode": "points", "points": [[0,0],[1,1],[2,0]], "parametric": false },
     *   ]
     * }
     * 每个 plot 还可以带自己的 "config" 对象，覆盖 defaults。
     *
     * @throws std::runtime_error JSON 非法、缺少字段、未知键或公式无法编译时抛出。
     */
    std::vector<PlotRequest> parse_scene(const std::string& json_string);

    // 按场景格式解析单个配置对象，未出现的键沿用 base
    SamplingConfig parse_config(const std::string& json_string, const SamplingConfig& base = {});

    // 结果序列化 (nlohmann::json)
    std::string results_to_json(const std::vector<PlotResult>& results, int indent = 2);

} // namespace NotePlot::JsonAdapter

#endif // NOTEPLOT_IO_JSON_ADAPTER_H
