#ifndef NOTEPLOT_CAS_RPN_SHUNTING_YARD_H
#define NOTEPLOT_CAS_RPN_SHUNTING_YARD_H

#include "RPN.h"
#include <string>
#include <string_view>

namespace NotePlot::Parser {

    struct CompileResult {
        AlignedVector<RPNToken> bytecode;
        bool uses_x = false;   // 引用了 x
        bool uses_t = false;   // 引用了 t / theta
    };

    /**
     * @brief 将中缀表达式编译为 RPN 字节码。
     *
     * 支持: + - * / ^ (右结合)、一元负号、括号、
     *       常量 pi / e、变量 x / t / theta、
     *       函数 sin cos tan exp ln sqrt abs sign。
     *
     * @throws std::runtime_error 语法错误、未知符号或括号不匹配时抛出。
     */
    CompileResult compile_infix_to_rpn(std::string_view expression);
}

#endif
