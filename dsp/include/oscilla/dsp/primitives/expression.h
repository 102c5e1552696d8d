// ==============================================================================
// Layer 1: DSP Primitive - Compiled Arithmetic Expression
// ==============================================================================
// Compiles the source of a custom-expression law into a flat stack program
// that evaluates without allocation.
//
// Grammar (precedence climbing, lowest first):
//   expr    := term (('+' | '-') term)*
//   term    := unary (('*' | '/') unary)*
//   unary   := ('-' | '+') unary | power
//   power   := primary (('^' | '**') unary)?       right associative
//   primary := number | name | name '(' expr (',' expr)? ')' | '(' expr ')'
//
// Names: "t" (time in seconds), "pi", "e", and every law parameter. Law
// parameters are bound as constants at compile time.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/mathematical_law.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Oscilla {
namespace DSP {

class CompiledExpression {
public:
    /// Deepest evaluation stack a program may need
    static constexpr size_t kMaxStackDepth = 64;

    /// @brief Compile an expression, binding parameter values
    /// @throws InvalidParameterError (parameter "expression") for an empty or
    ///         malformed source, an unknown name or a wrong argument count
    [[nodiscard]] static CompiledExpression compile(std::string_view source,
                                                    const ParameterMap& parameters);

    /// @brief Evaluate at time t
    [[nodiscard]] double evaluate(double t) const noexcept;

    /// @brief Number of instructions in the program
    [[nodiscard]] size_t size() const noexcept { return program_.size(); }

    /// @brief True if the program reads "t"
    [[nodiscard]] bool dependsOnTime() const noexcept { return dependsOnTime_; }

    using UnaryFn = double (*)(double);
    using BinaryFn = double (*)(double, double);

    enum class OpCode : uint8_t {
        PushConstant,
        PushTime,
        Add,
        Subtract,
        Multiply,
        Divide,
        Power,
        Negate,
        Call1,
        Call2
    };

    struct Instruction {
        OpCode op = OpCode::PushConstant;
        double value = 0.0;
        UnaryFn unary = nullptr;
        BinaryFn binary = nullptr;
    };

private:
    friend class ExpressionParser;

    CompiledExpression() = default;

    std::vector<Instruction> program_;
    bool dependsOnTime_ = false;
};

}  // namespace DSP
}  // namespace Oscilla
