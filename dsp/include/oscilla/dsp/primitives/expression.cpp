// ==============================================================================
// Compiled Arithmetic Expression Implementation
// ==============================================================================

#include "expression.h"

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/math_constants.h>

#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

namespace Oscilla {
namespace DSP {

namespace {

struct UnaryFunction {
    std::string_view name;
    CompiledExpression::UnaryFn fn;
};

struct BinaryFunction {
    std::string_view name;
    CompiledExpression::BinaryFn fn;
};

double signOf(double x) noexcept {
    if (x > 0.0) return 1.0;
    if (x < 0.0) return -1.0;
    return 0.0;
}

const std::array<UnaryFunction, 17> kUnaryFunctions = {{
    {"sin",   [](double x) { return std::sin(x); }},
    {"cos",   [](double x) { return std::cos(x); }},
    {"tan",   [](double x) { return std::tan(x); }},
    {"asin",  [](double x) { return std::asin(x); }},
    {"acos",  [](double x) { return std::acos(x); }},
    {"atan",  [](double x) { return std::atan(x); }},
    {"sinh",  [](double x) { return std::sinh(x); }},
    {"cosh",  [](double x) { return std::cosh(x); }},
    {"tanh",  [](double x) { return std::tanh(x); }},
    {"exp",   [](double x) { return std::exp(x); }},
    {"log",   [](double x) { return std::log(x); }},
    {"log10", [](double x) { return std::log10(x); }},
    {"sqrt",  [](double x) { return std::sqrt(x); }},
    {"abs",   [](double x) { return std::fabs(x); }},
    {"floor", [](double x) { return std::floor(x); }},
    {"ceil",  [](double x) { return std::ceil(x); }},
    {"sign",  &signOf},
}};

const std::array<BinaryFunction, 5> kBinaryFunctions = {{
    {"pow",   [](double a, double b) { return std::pow(a, b); }},
    {"min",   [](double a, double b) { return std::fmin(a, b); }},
    {"max",   [](double a, double b) { return std::fmax(a, b); }},
    {"atan2", [](double a, double b) { return std::atan2(a, b); }},
    {"fmod",  [](double a, double b) { return std::fmod(a, b); }},
}};

bool isNameStart(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isNameChar(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

// =============================================================================
// ExpressionParser
// =============================================================================

class ExpressionParser {
public:
    ExpressionParser(std::string_view source, const ParameterMap& parameters)
        : source_(source), parameters_(parameters) {}

    CompiledExpression parse() {
        skipSpace();
        if (pos_ >= source_.size()) {
            fail("expression is empty");
        }
        parseExpr();
        skipSpace();
        if (pos_ < source_.size()) {
            fail("unexpected '" + std::string(1, source_[pos_]) + "'");
        }
        if (maxDepth_ > CompiledExpression::kMaxStackDepth) {
            fail("expression is nested too deeply");
        }
        return std::move(result_);
    }

private:
    using OpCode = CompiledExpression::OpCode;

    [[noreturn]] void fail(const std::string& message) const {
        throw InvalidParameterError("expression", "invalid expression '" + std::string(source_) +
                                    "' at offset " + std::to_string(pos_) + ": " + message);
    }

    void skipSpace() noexcept {
        while (pos_ < source_.size() && std::isspace(static_cast<unsigned char>(source_[pos_])) != 0) {
            ++pos_;
        }
    }

    bool accept(std::string_view token) {
        skipSpace();
        if (source_.substr(pos_, token.size()) == token) {
            pos_ += token.size();
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!accept(std::string_view(&c, 1))) {
            fail(std::string("expected '") + c + "'");
        }
    }

    void emit(CompiledExpression::Instruction instruction, int stackEffect) {
        result_.program_.push_back(instruction);
        depth_ += stackEffect;
        if (depth_ > static_cast<int>(maxDepth_)) maxDepth_ = static_cast<size_t>(depth_);
    }

    void emitOp(OpCode op, int stackEffect) {
        CompiledExpression::Instruction instruction;
        instruction.op = op;
        emit(instruction, stackEffect);
    }

    void emitConstant(double value) {
        CompiledExpression::Instruction instruction;
        instruction.op = OpCode::PushConstant;
        instruction.value = value;
        emit(instruction, 1);
    }

    void parseExpr() {
        parseTerm();
        for (;;) {
            if (accept("+")) {
                parseTerm();
                emitOp(OpCode::Add, -1);
            } else if (accept("-")) {
                parseTerm();
                emitOp(OpCode::Subtract, -1);
            } else {
                return;
            }
        }
    }

    void parseTerm() {
        parseUnary();
        for (;;) {
            skipSpace();
            // "**" is power, handled below in parsePower
            if (source_.substr(pos_, 2) == "**") return;
            if (accept("*")) {
                parseUnary();
                emitOp(OpCode::Multiply, -1);
            } else if (accept("/")) {
                parseUnary();
                emitOp(OpCode::Divide, -1);
            } else {
                return;
            }
        }
    }

    void parseUnary() {
        if (accept("-")) {
            parseUnary();
            emitOp(OpCode::Negate, 0);
            return;
        }
        if (accept("+")) {
            parseUnary();
            return;
        }
        parsePower();
    }

    void parsePower() {
        parsePrimary();
        if (accept("^") || accept("**")) {
            parseUnary();
            emitOp(OpCode::Power, -1);
        }
    }

    void parsePrimary() {
        skipSpace();
        if (pos_ >= source_.size()) {
            fail("unexpected end of expression");
        }

        const char c = source_[pos_];
        if (c == '(') {
            ++pos_;
            parseExpr();
            expect(')');
            return;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.') {
            parseNumber();
            return;
        }
        if (isNameStart(c)) {
            parseName();
            return;
        }
        fail("unexpected '" + std::string(1, c) + "'");
    }

    void parseNumber() {
        const std::string text(source_.substr(pos_));
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        if (end == text.c_str()) {
            fail("malformed number");
        }
        pos_ += static_cast<size_t>(end - text.c_str());
        emitConstant(value);
    }

    void parseName() {
        const size_t start = pos_;
        while (pos_ < source_.size() && isNameChar(source_[pos_])) ++pos_;
        const std::string_view name = source_.substr(start, pos_ - start);

        skipSpace();
        if (pos_ < source_.size() && source_[pos_] == '(') {
            ++pos_;
            parseCall(name);
            return;
        }

        if (name == "t") {
            emitOp(OpCode::PushTime, 1);
            result_.dependsOnTime_ = true;
            return;
        }
        if (const auto it = parameters_.find(name); it != parameters_.end()) {
            emitConstant(it->second);
            return;
        }
        if (name == "pi") {
            emitConstant(kPiD);
            return;
        }
        if (name == "e") {
            emitConstant(kEulerD);
            return;
        }
        pos_ = start;
        fail("unknown name '" + std::string(name) + "'");
    }

    void parseCall(std::string_view name) {
        for (const auto& fn : kUnaryFunctions) {
            if (fn.name != name) continue;
            parseExpr();
            if (accept(",")) fail("'" + std::string(name) + "' takes one argument");
            expect(')');
            CompiledExpression::Instruction instruction;
            instruction.op = OpCode::Call1;
            instruction.unary = fn.fn;
            emit(instruction, 0);
            return;
        }
        for (const auto& fn : kBinaryFunctions) {
            if (fn.name != name) continue;
            parseExpr();
            if (!accept(",")) fail("'" + std::string(name) + "' takes two arguments");
            parseExpr();
            expect(')');
            CompiledExpression::Instruction instruction;
            instruction.op = OpCode::Call2;
            instruction.binary = fn.fn;
            emit(instruction, -1);
            return;
        }
        fail("unknown function '" + std::string(name) + "'");
    }

    std::string_view source_;
    const ParameterMap& parameters_;
    size_t pos_ = 0;
    int depth_ = 0;
    size_t maxDepth_ = 0;
    CompiledExpression result_;
};

// =============================================================================
// CompiledExpression
// =============================================================================

CompiledExpression CompiledExpression::compile(std::string_view source,
                                               const ParameterMap& parameters) {
    return ExpressionParser(source, parameters).parse();
}

double CompiledExpression::evaluate(double t) const noexcept {
    std::array<double, kMaxStackDepth> stack{};
    size_t top = 0;

    for (const auto& instruction : program_) {
        switch (instruction.op) {
            case OpCode::PushConstant:
                stack[top++] = instruction.value;
                break;
            case OpCode::PushTime:
                stack[top++] = t;
                break;
            case OpCode::Add:
                --top;
                stack[top - 1] += stack[top];
                break;
            case OpCode::Subtract:
                --top;
                stack[top - 1] -= stack[top];
                break;
            case OpCode::Multiply:
                --top;
                stack[top - 1] *= stack[top];
                break;
            case OpCode::Divide:
                --top;
                stack[top - 1] /= stack[top];
                break;
            case OpCode::Power:
                --top;
                stack[top - 1] = std::pow(stack[top - 1], stack[top]);
                break;
            case OpCode::Negate:
                stack[top - 1] = -stack[top - 1];
                break;
            case OpCode::Call1:
                stack[top - 1] = instruction.unary(stack[top - 1]);
                break;
            case OpCode::Call2:
                --top;
                stack[top - 1] = instruction.binary(stack[top - 1], stack[top]);
                break;
        }
    }
    return top > 0 ? stack[top - 1] : 0.0;
}

}  // namespace DSP
}  // namespace Oscilla
