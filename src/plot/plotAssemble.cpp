// --- 文件路径: src/plot/plotAssemble.cpp ---
#include "pch.h"
#include "noteplot/plot/plotAssemble.h"

namespace NotePlot {

std::vector<Polyline> assemble(const RawSequence& raw) {
    std::vector<Polyline> lines;
    Polyline current;

    for (const auto& entry : raw) {
        if (is_break(entry)) {
            if (!current.empty()) {
                lines.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(as_point(entry));
    }
    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

RawSequence normalize_breaks(const RawSequence& raw) {
    RawSequence out;
    out.reserve(raw.size());
    for (const auto& entry : raw) {
        if (is_break(entry) && (out.empty() || is_break(out.back()))) continue;
        out.push_back(entry);
    }
    if (!out.empty() && is_break(out.back())) out.pop_back();
    return out;
}

} // namespace NotePlot
