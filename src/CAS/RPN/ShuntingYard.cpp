// --- 文件路径: src/CAS/RPN/ShuntingYard.cpp ---
#include "noteplot/CAS/RPN/ShuntingYard.h"
#include <stack>
#include <stdexcept>
#include <algorithm>
#include <unordered_map>
#include <cctype>
#include <cstdlib>

namespace NotePlot::Parser {

namespace {
    // 优先级定义 (一元负号低于乘方: -x^2 == -(x^2))
    enum Precedence { LOWEST = 0, ADD_SUB = 2, MUL_DIV = 3, UNARY_NEG = 4, POW = 5, FUNC = 6 };

    struct Op { std::string name; Precedence prec; RPNTokenType type; bool is_func; bool right_assoc; };

    // 内部映射：操作符名到 RPN 类型
    RPNTokenType get_operator_type(char c) {
        switch (c) {
            case '+': return RPNTokenType::ADD;
            case '-': return RPNTokenType::SUB;
            case '*': return RPNTokenType::MUL;
            case '/': return RPNTokenType::DIV;
            case '^': return RPNTokenType::POW;
            default:  return RPNTokenType::PUSH_CONST;
        }
    }

    std::string to_lower(std::string_view name) {
        std::string n(name);
        std::transform(n.begin(), n.end(), n.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return n;
    }

    // 映射内置数学函数
    bool try_get_math_builtin(std::string_view name, RPNTokenType& out_type) {
        static const std::unordered_map<std::string, RPNTokenType> builtin_map = {
            {"sin", RPNTokenType::SIN}, {"cos", RPNTokenType::COS}, {"tan", RPNTokenType::TAN},
            {"exp", RPNTokenType::EXP}, {"ln", RPNTokenType::LN},   {"abs", RPNTokenType::ABS},
            {"sqrt", RPNTokenType::SQRT}, {"sign", RPNTokenType::SIGN}
        };
        auto it = builtin_map.find(to_lower(name));
        if (it != builtin_map.end()) {
            out_type = it->second;
            return true;
        }
        return false;
    }

    bool try_get_constant(std::string_view name, double& out_value) {
        std::string n = to_lower(name);
        if (n == "pi") { out_value = M_PI; return true; }
        if (n == "e")  { out_value = std::exp(1.0); return true; }
        return false;
    }
}

CompileResult compile_infix_to_rpn(std::string_view expression) {
    CompileResult result;
    std::stack<Op> op_stack;

    // 状态机：是否期待一个操作数。
    // 在表达式开头、左括号后、运算符后，我们都期待一个操作数。
    bool expect_operand = true;

    auto emit = [&](RPNTokenType type, double val = 0.0) {
        result.bytecode.push_back({type, val});
    };

    size_t i = 0;
    const size_t n = expression.length();

    while (i < n) {
        char c = expression[i];
        if (std::isspace(static_cast<unsigned char>(c))) { i++; continue; }

        // 1. 处理数字
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            if (!expect_operand) throw std::runtime_error("Unexpected number at position " + std::to_string(i));
            std::string literal;
            size_t start = i;
            while (i < n && (std::isdigit(static_cast<unsigned char>(expression[i])) || expression[i] == '.')) i++;
            // 科学计数法 1e-3
            if (i < n && (expression[i] == 'e' || expression[i] == 'E')) {
                size_t j = i + 1;
                if (j < n && (expression[j] == '+' || expression[j] == '-')) j++;
                if (j < n && std::isdigit(static_cast<unsigned char>(expression[j]))) {
                    i = j;
                    while (i < n && std::isdigit(static_cast<unsigned char>(expression[i]))) i++;
                }
            }
            literal.assign(expression.substr(start, i - start));
            char* end = nullptr;
            double val = std::strtod(literal.c_str(), &end);
            if (end != literal.c_str() + literal.size()) {
                throw std::runtime_error("Invalid number literal: " + literal);
            }
            emit(RPNTokenType::PUSH_CONST, val);
            expect_operand = false; // 拿到数字了，下一个应该是运算符
        }
        // 2. 处理单词
        else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            if (!expect_operand) throw std::runtime_error("Unexpected identifier at position " + std::to_string(i));
            size_t start = i;
            while (i < n && (std::isalnum(static_cast<unsigned char>(expression[i])) || expression[i] == '_')) {
                i++;
            }
            std::string_view word = expression.substr(start, i - start);

            size_t peek = i;
            while (peek < n && std::isspace(static_cast<unsigned char>(expression[peek]))) peek++;

            if (peek < n && expression[peek] == '(') {
                RPNTokenType bt;
                if (!try_get_math_builtin(word, bt)) {
                    throw std::runtime_error("Unknown function: " + std::string(word));
                }
                op_stack.push({std::string(word), FUNC, bt, true, false});
                op_stack.push({"(", LOWEST, RPNTokenType::PUSH_CONST, false, false});
                i = peek + 1;
                expect_operand = true;
            } else {
                std::string lw = to_lower(word);
                double constant = 0.0;
                if (lw == "x") {
                    emit(RPNTokenType::PUSH_X);
                    result.uses_x = true;
                } else if (lw == "t" || lw == "theta") {
                    emit(RPNTokenType::PUSH_T);
                    result.uses_t = true;
                } else if (try_get_constant(word, constant)) {
                    emit(RPNTokenType::PUSH_CONST, constant);
                } else {
                    throw std::runtime_error("Unknown symbol: " + std::string(word));
                }
                expect_operand = false;
            }
        }
        // 3. 处理运算符
        else if (c == '+' || c == '-' || c == '*' || c == '/' || c == '^') {
            if (expect_operand) {
                // 一元正负号
                if (c == '-') {
                    op_stack.push({"neg", UNARY_NEG, RPNTokenType::NEG, false, true});
                    i++;
                    continue;
                }
                if (c == '+') { i++; continue; }
                throw std::runtime_error("Unexpected operator at position " + std::to_string(i));
            }

            Precedence p = (c == '+' || c == '-') ? ADD_SUB : (c == '^' ? POW : MUL_DIV);
            bool right_assoc = (c == '^');
            while (!op_stack.empty() && op_stack.top().name != "(" &&
                   (op_stack.top().prec > p || (!right_assoc && op_stack.top().prec == p))) {
                emit(op_stack.top().type);
                op_stack.pop();
            }
            op_stack.push({std::string(1, c), p, get_operator_type(c), false, right_assoc});
            i++;
            expect_operand = true; // 运算符后期待操作数
        }
        else if (c == '(') {
            if (!expect_operand) throw std::runtime_error("Unexpected '(' at position " + std::to_string(i));
            op_stack.push({"(", LOWEST, RPNTokenType::PUSH_CONST, false, false});
            i++;
            expect_operand = true;
        }
        else if (c == ')') {
            if (expect_operand) throw std::runtime_error("Unexpected ')' at position " + std::to_string(i));
            while (!op_stack.empty() && op_stack.top().name != "(") {
                emit(op_stack.top().type);
                op_stack.pop();
            }
            if (op_stack.empty()) throw std::runtime_error("Mismatched parentheses");
            op_stack.pop(); // pop "("

            if (!op_stack.empty() && op_stack.top().is_func) {
                emit(op_stack.top().type);
                op_stack.pop();
            }
            i++;
            expect_operand = false;
        }
        else {
            throw std::runtime_error(std::string("Unexpected character '") + c + "' at position " + std::to_string(i));
        }
    }

    if (expect_operand) throw std::runtime_error("Incomplete expression");

    while (!op_stack.empty()) {
        if (op_stack.top().name == "(") throw std::runtime_error("Mismatched parentheses");
        emit(op_stack.top().type);
        op_stack.pop();
    }

    validate_rpn(result.bytecode);
    return result;
}

} // namespace NotePlot::Parser
