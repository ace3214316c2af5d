// --- 文件路径: src/io/JsonAdapter.cpp ---

#include "pch.h"
#include "noteplot/io/JsonAdapter.h"
#include "noteplot/CAS/RPN/ShuntingYard.h"
#include "noteplot/plot/plotSpline.h"
#include <simdjson.h>
#include <nlohmann/json.hpp>

namespace NotePlot::JsonAdapter {
namespace {
    using simdjson::dom::element;
    using simdjson::dom::object;
    using simdjson::dom::array;

    std::optional<element> find_key(const object& obj, std::string_view key) {
        auto res = obj[key];
        if (res.error()) return std::nullopt;
        return res.value();
    }

    double read_double(const element& e, std::string_view key) {
        auto res = e.get_double();
        if (res.error()) throw std::runtime_error("'" + std::string(key) + "' 必须是数字");
        return res.value();
    }

    int read_int(const element& e, std::string_view key) {
        auto res = e.get_int64();
        if (res.error()) throw std::runtime_error("'" + std::string(key) + "' 必须是整数");
        int64_t v = res.value();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw std::runtime_error("'" + std::string(key) + "' 超出范围");
        }
        return static_cast<int>(v);
    }

    bool read_bool(const element& e, std::string_view key) {
        auto res = e.get_bool();
        if (res.error()) throw std::runtime_error("'" + std::string(key) + "' 必须是布尔值");
        return res.value();
    }

    std::string read_string(const element& e, std::string_view key) {
        auto res = e.get_string();
        if (res.error()) throw std::runtime_error("'" + std::string(key) + "' 必须是字符串");
        return std::string(res.value());
    }

    object read_object(const element& e, std::string_view key) {
        auto res = e.get_object();
        if (res.error()) throw std::runtime_error("'" + std::string(key) + "' 必须是对象");
        return res.value();
    }

    array read_array(const element& e, std::string_view key) {
        auto res = e.get_array();
        if (res.error()) throw std::runtime_error("'" + std::string(key) + "' 必须是数组");
        return res.value();
    }

    element require_key(const object& obj, std::string_view key, const std::string& where) {
        auto e = find_key(obj, key);
        if (!e) throw std::runtime_error(where + " 缺少字段 '" + std::string(key) + "'");
        return *e;
    }

    SamplingStrategy parse_strategy(const std::string& s) {
        if (s == "dense") return SamplingStrategy::Dense;
        if (s == "warped") return SamplingStrategy::Warped;
        if (s == "adaptive") return SamplingStrategy::Adaptive;
        throw std::runtime_error("未知采样策略: " + s);
    }

    WarpKind parse_warp(const std::string& s) {
        if (s == "cubic") return WarpKind::Cubic;
        if (s == "tanh") return WarpKind::Tanh;
        throw std::runtime_error("未知变形函数: " + s);
    }

    // =========================================================
    // 配置对象 -> SamplingConfig
    // 键名沿用构建配置的 kebab-case 写法
    // =========================================================
    SamplingConfig apply_config(const object& obj, SamplingConfig cfg) {
        for (auto field : obj) {
            std::string_view key = field.key;
            element v = field.value;

            if (key == "strategy")            cfg.strategy = parse_strategy(read_string(v, key));
            else if (key == "sample-count")   cfg.sample_count = read_int(v, key);
            else if (key == "min-step")       cfg.min_step = read_double(v, key);
            else if (key == "max-step")       cfg.max_step = read_double(v, key);
            else if (key == "tolerance")      cfg.tolerance = read_double(v, key);
            else if (key == "relative-error") cfg.relative_error = read_bool(v, key);
            else if (key == "max-refinement") cfg.max_refinement = read_int(v, key);
            else if (key == "point-ceiling")  cfg.point_ceiling = read_int(v, key);
            else if (key == "max-iterations") cfg.max_iterations = read_int(v, key);
            else if (key == "growth-factor")  cfg.growth_factor = read_double(v, key);
            else if (key == "center")         cfg.center = read_double(v, key);
            else if (key == "warp")           cfg.warp = parse_warp(read_string(v, key));
            else if (key == "jump-threshold") cfg.jump_threshold = read_double(v, key);
            else if (key == "jump-relative")  cfg.jump_relative = read_double(v, key);
            else if (key == "zero-epsilon")   cfg.zero_epsilon = read_double(v, key);
            else if (key == "value-ceiling")  cfg.value_ceiling = read_double(v, key);
            else if (key == "time-budget-ms") cfg.time_budget_ms = read_double(v, key);
            else throw std::runtime_error("未知配置项: " + std::string(key));
        }
        return cfg;
    }

    Domain parse_domain(const element& e) {
        array arr = read_array(e, "domain");
        if (arr.size() != 2) throw std::runtime_error("'domain' 必须是 [min, max]");
        Domain d{read_double(arr.at(0).value(), "domain"), read_double(arr.at(1).value(), "domain")};
        d.validate();
        return d;
    }

    AlignedVector<RPNToken> compile(const object& plot, std::string_view key, const std::string& where) {
        std::string expr = read_string(require_key(plot, key, where), key);
        try {
            return Parser::compile_infix_to_rpn(expr).bytecode;
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(where + " 公式 '" + expr + "' 编译失败: " + e.what());
        }
    }

    std::vector<Vec2> parse_points(const element& e) {
        std::vector<Vec2> pts;
        for (element item : read_array(e, "points")) {
            array pair = read_array(item, "points");
            if (pair.size() != 2) throw std::runtime_error("'points' 的每一项必须是 [x, y]");
            pts.push_back({read_double(pair.at(0).value(), "points"), read_double(pair.at(1).value(), "points")});
        }
        return pts;
    }

    PlotRequest parse_plot(const object& plot, size_t index, const SamplingConfig& defaults) {
        PlotRequest req;
        req.name = "plot" + std::to_string(index);
        if (auto n = find_key(plot, "name")) req.name = read_string(*n, "name");
        const std::string where = "[Scene] '" + req.name + "'";

        req.config = defaults;
        if (auto c = find_key(plot, "config")) req.config = apply_config(read_object(*c, "config"), defaults);

        std::string mode = "explicit";
        if (auto m = find_key(plot, "mode")) mode = read_string(*m, "mode");

        std::optional<Domain> domain;
        if (auto d = find_key(plot, "domain")) domain = parse_domain(*d);

        if (mode == "explicit") {
            req.curve = make_rpn_explicit_curve(compile(plot, "expr", where));
        } else if (mode == "parametric") {
            req.curve = make_rpn_parametric_curve(compile(plot, "x", where), compile(plot, "y", where));
        } else if (mode == "polar") {
            req.curve = make_rpn_polar_curve(compile(plot, "r", where));
        } else if (mode == "points") {
            bool parametric = false;
            if (auto p = find_key(plot, "parametric")) parametric = read_bool(*p, "parametric");
            auto pts = parse_points(require_key(plot, "points", where));
            SplineCurve spline = parametric ? make_parametric_spline(pts) : make_spline_curve(pts);
            req.curve = std::move(spline.curve);
            if (!domain) domain = spline.domain;
        } else {
            throw std::runtime_error(where + " 未知模式: " + mode);
        }

        if (!domain) throw std::runtime_error(where + " 缺少字段 'domain'");
        req.domain = *domain;
        return req;
    }

    nlohmann::json point_to_json(const SamplePoint& p) {
        return {p.x, p.y};
    }

    nlohmann::json stats_to_json(const SampleStats& s) {
        return {
            {"evaluations", s.evaluations},
            {"iterations", s.iterations},
            {"forced-accepts", s.forced_accepts},
            {"breaks", s.breaks},
            {"point-ceiling-hit", s.point_ceiling_hit},
            {"iteration-limit-hit", s.iteration_limit_hit},
            {"time-budget-hit", s.time_budget_hit}
        };
    }
}

// ====================================================================
//  parse_scene
//  - 默认点数上限取顶层 "render-sample-count"
//  - "defaults" 在其上叠加，每个 plot 的 "config" 再叠加
// ====================================================================
std::vector<PlotRequest> parse_scene(const std::string& json_string) {
    thread_local simdjson::dom::parser parser;
    try {
        element root = parser.parse(json_string);
        object scene = read_object(root, "scene");

        SamplingConfig defaults;
        if (auto r = find_key(scene, "render-sample-count")) {
            defaults.point_ceiling = read_int(*r, "render-sample-count");
        }
        if (auto d = find_key(scene, "defaults")) defaults = apply_config(read_object(*d, "defaults"), defaults);

        array plots = read_array(require_key(scene, "plots", "[Scene]"), "plots");
        std::vector<PlotRequest> requests;
        requests.reserve(plots.size());
        size_t index = 0;
        for (element p : plots) {
            requests.push_back(parse_plot(read_object(p, "plots"), index++, defaults));
        }
        return requests;
    } catch (const simdjson::simdjson_error& e) {
        throw std::runtime_error("simdjson 解析失败: " + std::string(e.what()));
    }
}

SamplingConfig parse_config(const std::string& json_string, const SamplingConfig& base) {
    thread_local simdjson::dom::parser parser;
    try {
        element root = parser.parse(json_string);
        return apply_config(read_object(root, "config"), base);
    } catch (const simdjson::simdjson_error& e) {
        throw std::runtime_error("simdjson 解析失败: " + std::string(e.what()));
    }
}

std::string results_to_json(const std::vector<PlotResult>& results, int indent) {
    nlohmann::json plots = nlohmann::json::array();
    for (const auto& res : results) {
        nlohmann::json j;
        j["name"] = res.name;
        if (!res.ok()) {
            j["error"] = res.error;
            plots.push_back(std::move(j));
            continue;
        }
        nlohmann::json lines = nlohmann::json::array();
        for (const auto& line : res.polylines) {
            nlohmann::json pts = nlohmann::json::array();
            for (const auto& p : line) pts.push_back(point_to_json(p));
            lines.push_back(std::move(pts));
        }
        j["polylines"] = std::move(lines);
        j["stats"] = stats_to_json(res.stats);
        plots.push_back(std::move(j));
    }
    nlohmann::json out;
    out["plots"] = std::move(plots);
    return out.dump(indent);
}

} // namespace NotePlot::JsonAdapter
