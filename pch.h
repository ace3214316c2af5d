#ifndef NOTEPLOT_PCH_H
#define NOTEPLOT_PCH_H
#define NOMINMAX
// 标准库
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <cmath>
#include <stdexcept>
#include <optional>
#include <array>
#include <limits>
#include <utility>
#include <chrono>
#include <stack>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <cstdint>
#include <functional>
#include <variant>

// 第三方库
#include <xsimd/xsimd.hpp>
// --- 全局共享的核心数据结构与宏定义 ---

namespace xs = xsimd;

template <typename T>
using AlignedVector = std::vector<T, xsimd::aligned_allocator<T>>;

struct Vec2 { double x; double y; };

using batch_type = xs::batch<double>;

// 定义一个可以在编译期获取 SIMD 宽度的常量。
constexpr size_t BATCH_SIZE = batch_type::size;

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#ifdef _MSC_VER
#define NOTEPLOT_FORCE_INLINE __forceinline
#else
#define NOTEPLOT_FORCE_INLINE inline __attribute__((always_inline))
#endif

#endif //NOTEPLOT_PCH_H
