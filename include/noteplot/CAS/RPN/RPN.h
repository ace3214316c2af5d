// --- 文件路径: include/noteplot/CAS/RPN/RPN.h ---

#ifndef NOTEPLOT_RPN_H
#define NOTEPLOT_RPN_H

#include "pch.h"
#include "noteplot/functions/functions.h"

namespace NotePlot {

// ====================================================================
//          ↓↓↓ RPN Token 定义 ↓↓↓
// ====================================================================

enum class RPNTokenType {
    // Variables and Constants
    PUSH_CONST, PUSH_X, PUSH_T,
    // Basic Arithmetic
    ADD, SUB, MUL, DIV, NEG,
    // Powers and Roots
    POW, SQRT,
    // Exponential and Logarithmic
    EXP, LN,
    // Trigonometric
    SIN, COS, TAN,
    // Other
    SIGN, ABS
};

struct RPNToken {
    RPNTokenType type;
    double value = 0.0;
};

constexpr size_t RPN_MAX_STACK_DEPTH = 64;

// ====================================================================
//          ↓↓↓ RPN 解析与校验 ↓↓↓
// ====================================================================

// 解析以空格分隔的纯 RPN 字符串，例如 "x 2 pow 1 -"
AlignedVector<RPNToken> parse_rpn(const std::string& rpn_string);

/**
 * @brief 静态检查栈平衡：每条指令都有足够的操作数，结束时栈上恰好一个值，
 *        且深度不超过 RPN_MAX_STACK_DEPTH。
 * @throws std::runtime_error 程序非法时抛出。
 */
void validate_rpn(const AlignedVector<RPNToken>& program);

// 程序是否引用了指定变量
bool rpn_uses(const AlignedVector<RPNToken>& program, RPNTokenType var);

std::string rpn_to_string(const AlignedVector<RPNToken>& program);

// ====================================================================
//          ↓↓↓ 求值 (double / SIMD batch) ↓↓↓
// ====================================================================
// x 与 t 都绑定到同一个自变量：显函数写 x，参数方程写 t，极坐标写 theta (即 t)。
// 程序必须先经过 validate_rpn。

template<typename T>
NOTEPLOT_FORCE_INLINE T evaluate_rpn(const AlignedVector<RPNToken>& p, const T& x)
{
    std::array<T, RPN_MAX_STACK_DEPTH> s{};
    int sp = 0;
    for (const auto& t : p) {
        switch (t.type) {
            case RPNTokenType::PUSH_CONST: s[sp++] = T(t.value); break;
            case RPNTokenType::PUSH_X:     s[sp++] = x; break;
            case RPNTokenType::PUSH_T:     s[sp++] = x; break;

            case RPNTokenType::ADD:      --sp; s[sp - 1] += s[sp]; break;
            case RPNTokenType::SUB:      --sp; s[sp - 1] -= s[sp]; break;
            case RPNTokenType::MUL:      --sp; s[sp - 1] *= s[sp]; break;
            case RPNTokenType::DIV:      --sp; s[sp - 1] /= s[sp]; break;
            case RPNTokenType::NEG:      s[sp - 1] = -s[sp - 1]; break;

            case RPNTokenType::POW:
                --sp;
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = pow_batch(s[sp - 1], s[sp]);
                else s[sp - 1] = std::pow(s[sp - 1], s[sp]);
                break;
            case RPNTokenType::SQRT:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::sqrt(s[sp - 1]);
                else s[sp - 1] = std::sqrt(s[sp - 1]);
                break;
            case RPNTokenType::SIN:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::sin(s[sp - 1]);
                else s[sp - 1] = std::sin(s[sp - 1]);
                break;
            case RPNTokenType::COS:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::cos(s[sp - 1]);
                else s[sp - 1] = std::cos(s[sp - 1]);
                break;
            case RPNTokenType::TAN:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::tan(s[sp - 1]);
                else s[sp - 1] = std::tan(s[sp - 1]);
                break;
            case RPNTokenType::LN:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::log(s[sp - 1]);
                else s[sp - 1] = std::log(s[sp - 1]);
                break;
            case RPNTokenType::EXP:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::exp(s[sp - 1]);
                else s[sp - 1] = std::exp(s[sp - 1]);
                break;
            case RPNTokenType::ABS:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::abs(s[sp - 1]);
                else s[sp - 1] = std::abs(s[sp - 1]);
                break;
            case RPNTokenType::SIGN:
                if constexpr (std::is_same_v<T, batch_type>) s[sp - 1] = xs::sign(s[sp - 1]);
                else s[sp - 1] = (s[sp - 1] > T(0)) - (s[sp - 1] < T(0));
                break;
        }
    }
    return s[0];
}

} // namespace NotePlot

#endif //NOTEPLOT_RPN_H
