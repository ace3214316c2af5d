// --- 文件路径: src/CAS/RPN/RPN.cpp ---

#include "pch.h"
#include "noteplot/CAS/RPN/RPN.h"

namespace NotePlot {

namespace {
    // 每条指令的 (消耗, 产出)
    std::pair<int, int> stack_effect(RPNTokenType type) {
        switch (type) {
            case RPNTokenType::PUSH_CONST:
            case RPNTokenType::PUSH_X:
            case RPNTokenType::PUSH_T:
                return {0, 1};
            case RPNTokenType::ADD:
            case RPNTokenType::SUB:
            case RPNTokenType::MUL:
            case RPNTokenType::DIV:
            case RPNTokenType::POW:
                return {2, 1};
            default:
                return {1, 1};
        }
    }

    const char* token_name(RPNTokenType type) {
        switch (type) {
            case RPNTokenType::PUSH_X: return "x";
            case RPNTokenType::PUSH_T: return "t";
            case RPNTokenType::ADD:    return "+";
            case RPNTokenType::SUB:    return "-";
            case RPNTokenType::MUL:    return "*";
            case RPNTokenType::DIV:    return "/";
            case RPNTokenType::NEG:    return "neg";
            case RPNTokenType::POW:    return "pow";
            case RPNTokenType::SQRT:   return "sqrt";
            case RPNTokenType::EXP:    return "exp";
            case RPNTokenType::LN:     return "ln";
            case RPNTokenType::SIN:    return "sin";
            case RPNTokenType::COS:    return "cos";
            case RPNTokenType::TAN:    return "tan";
            case RPNTokenType::SIGN:   return "sign";
            case RPNTokenType::ABS:    return "abs";
            case RPNTokenType::PUSH_CONST: break;
        }
        return "";
    }
}

AlignedVector<RPNToken> parse_rpn(const std::string& rpn_string) {
    AlignedVector<RPNToken> tokens;
    std::stringstream ss(rpn_string);
    std::string token_str;
    while (ss >> token_str) {
        if (token_str == "x") tokens.push_back({RPNTokenType::PUSH_X});
        else if (token_str == "t" || token_str == "_t_") tokens.push_back({RPNTokenType::PUSH_T});
        else if (token_str == "+") tokens.push_back({RPNTokenType::ADD});
        else if (token_str == "-") tokens.push_back({RPNTokenType::SUB});
        else if (token_str == "*") tokens.push_back({RPNTokenType::MUL});
        else if (token_str == "/") tokens.push_back({RPNTokenType::DIV});
        else if (token_str == "neg") tokens.push_back({RPNTokenType::NEG});
        else if (token_str == "sin") tokens.push_back({RPNTokenType::SIN});
        else if (token_str == "cos") tokens.push_back({RPNTokenType::COS});
        else if (token_str == "exp") tokens.push_back({RPNTokenType::EXP});
        else if (token_str == "tan") tokens.push_back({RPNTokenType::TAN});
        else if (token_str == "pow") tokens.push_back({RPNTokenType::POW});
        else if (token_str == "sqrt") tokens.push_back({RPNTokenType::SQRT});
        else if (token_str == "sign") tokens.push_back({RPNTokenType::SIGN});
        else if (token_str == "abs") tokens.push_back({RPNTokenType::ABS});
        else if (token_str == "ln") tokens.push_back({RPNTokenType::LN});
        else {
            size_t consumed = 0;
            double value = 0.0;
            try { value = std::stod(token_str, &consumed); }
            catch (const std::invalid_argument&) { throw std::runtime_error("无效的RPN指令: " + token_str); }
            catch (const std::out_of_range&) { throw std::runtime_error("RPN常量超出范围: " + token_str); }
            if (consumed != token_str.size()) throw std::runtime_error("无效的RPN指令: " + token_str);
            tokens.push_back({RPNTokenType::PUSH_CONST, value});
        }
    }
    validate_rpn(tokens);
    return tokens;
}

void validate_rpn(const AlignedVector<RPNToken>& program) {
    if (program.empty()) throw std::runtime_error("Empty RPN program");
    int depth = 0;
    for (size_t i = 0; i < program.size(); ++i) {
        auto [pops, pushes] = stack_effect(program[i].type);
        if (depth < pops) {
            throw std::runtime_error("RPN stack underflow at instruction " + std::to_string(i));
        }
        depth += pushes - pops;
        if (depth > static_cast<int>(RPN_MAX_STACK_DEPTH)) {
            throw std::runtime_error("RPN program exceeds maximum stack depth");
        }
    }
    if (depth != 1) {
        throw std::runtime_error("RPN program leaves " + std::to_string(depth) + " values on the stack");
    }
}

bool rpn_uses(const AlignedVector<RPNToken>& program, RPNTokenType var) {
    return std::any_of(program.begin(), program.end(), [var](const RPNToken& t) { return t.type == var; });
}

std::string rpn_to_string(const AlignedVector<RPNToken>& program) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& t : program) {
        if (!first) oss << ' ';
        first = false;
        if (t.type == RPNTokenType::PUSH_CONST) oss << t.value;
        else oss << token_name(t.type);
    }
    return oss.str();
}

} // namespace NotePlot
