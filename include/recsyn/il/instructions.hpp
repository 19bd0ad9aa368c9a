// Normalized low-level instruction tree (ILAst-like) consumed by the matchers.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "recsyn/type_system.hpp"

namespace recsyn::il {

enum class VariableKind { Parameter, Local, StackSlot };

// `this` is the parameter with index -1; declared parameters start at 0.
struct Variable {
    VariableKind kind{VariableKind::Local};
    int index{0};
    std::string name;
    TypeId type{invalid_id};
};
using VariablePtr = std::shared_ptr<const Variable>;

struct Instruction;
using InstPtr = std::shared_ptr<const Instruction>;

struct Nop {};
struct LdcI4 { int32_t value; };
struct LdStr { std::string value; };
struct LdNull {};
struct LdTypeToken { TypeId type; };
struct LdLoc { VariablePtr var; };
struct StLoc { VariablePtr var; InstPtr value; };
struct LdFld { InstPtr target; FieldRef field; };
struct StFld { InstPtr target; FieldRef field; InstPtr value; };
struct LdsFld { FieldRef field; };
struct StsFld { FieldRef field; InstPtr value; };
struct AddressOf { InstPtr value; TypeId type; };

struct CallArgs {
    MethodRef method;
    std::vector<InstPtr> args;
    TypeId constrained_to{invalid_id}; // constrained. prefix on callvirt
};
struct Call : CallArgs {};
struct CallVirt : CallArgs {};
struct NewObj : CallArgs {};

enum class ComparisonKind { Equality, Inequality, LessThan, LessThanOrEqual, GreaterThan, GreaterThanOrEqual };
struct Comp { ComparisonKind kind; InstPtr lhs; InstPtr rhs; };

struct LogicAnd { InstPtr lhs; InstPtr rhs; };

enum class BinaryOp { Add, Sub, Mul };
struct BinaryNumeric { BinaryOp op; bool check_overflow; InstPtr lhs; InstPtr rhs; };

struct IfInstruction { InstPtr condition; InstPtr true_inst; InstPtr false_inst; };

struct Block {
    std::string label;
    std::vector<InstPtr> instructions;
};
// Blocks[0] is the entry point.
struct BlockContainer { std::vector<InstPtr> blocks; };
struct Branch { std::string target; };
// Return is a leave out of the function body container.
struct Leave { InstPtr value; bool exits_function; };

using InstData = std::variant<Nop, LdcI4, LdStr, LdNull, LdTypeToken, LdLoc, StLoc, LdFld, StFld, LdsFld, StsFld,
                              AddressOf, Call, CallVirt, NewObj, Comp, LogicAnd, BinaryNumeric, IfInstruction,
                              Block, BlockContainer, Branch, Leave>;

struct Instruction {
    InstData data;
};

template<typename T>
inline InstPtr make(T v){ return std::make_shared<const Instruction>(Instruction{InstData{std::move(v)}}); }

template<typename T>
inline const T* as(const Instruction* inst){ return inst ? std::get_if<T>(&inst->data) : nullptr; }
template<typename T>
inline const T* as(const InstPtr& inst){ return as<T>(inst.get()); }

// Call, CallVirt or NewObj viewed through their shared operands.
inline const CallArgs* as_call_args(const Instruction* inst){
    if(auto* c = as<Call>(inst)) return c;
    if(auto* c = as<CallVirt>(inst)) return c;
    if(auto* c = as<NewObj>(inst)) return c;
    return nullptr;
}

const char* opcode_name(const Instruction& inst);

struct Function {
    MethodId method{invalid_id};
    std::vector<VariablePtr> variables;
    InstPtr body;

    VariablePtr parameter(int index) const {
        for(auto& v : variables)
            if(v->kind == VariableKind::Parameter && v->index == index) return v;
        return nullptr;
    }
};

// A decompiled method body reduced to its entry block.
struct NormalizedBody {
    std::shared_ptr<const Function> function;
    const Block* entry{nullptr};

    size_t size() const { return entry ? entry->instructions.size() : 0; }
    // Null when out of range so matchers can chain without bounds checks.
    const Instruction* at(size_t i) const { return i < size() ? entry->instructions[i].get() : nullptr; }
    VariablePtr parameter(int index) const { return function ? function->parameter(index) : nullptr; }
};

} // namespace recsyn::il
