#pragma once

#include <string>

#include <llvm/ADT/SmallVector.h>

#include "recsyn/il/instructions.hpp"

// Structural pattern helpers over the instruction tree. Every helper accepts a
// null instruction and reports no match, and only writes its out-parameters
// on success.
namespace recsyn::il::match {

// leave <value> out of the function (value may be a Nop for void returns).
bool match_return(const Instruction* inst, const Instruction*& value);
bool match_leave(const Instruction* inst, const Instruction*& value);
bool match_nop(const Instruction* inst);

bool match_ld_this(const Instruction* inst);
bool match_ld_loc(const Instruction* inst, VariablePtr& var);
bool match_ld_loc_of(const Instruction* inst, const VariablePtr& var);
bool match_st_loc(const Instruction* inst, VariablePtr& var, const Instruction*& value);
bool match_ld_str(const Instruction* inst, std::string& text);
bool match_ldc_i4(const Instruction* inst, int32_t& value);
bool match_ldc_i4_of(const Instruction* inst, int32_t expected);
bool match_ld_null(const Instruction* inst);

bool match_ld_fld(const Instruction* inst, const Instruction*& target, FieldRef& field);
bool match_lds_fld(const Instruction* inst, FieldRef& field);
bool match_st_fld(const Instruction* inst, const Instruction*& target, FieldRef& field, const Instruction*& value);
bool match_sts_fld(const Instruction* inst, FieldRef& field, const Instruction*& value);

bool match_if_instruction(const Instruction* inst, const Instruction*& condition, const Instruction*& true_inst);
bool match_logic_and(const Instruction* inst, const Instruction*& lhs, const Instruction*& rhs);
// comp(arg != ldnull), either operand order
bool match_comp_not_equals_null(const Instruction* inst, const Instruction*& arg);
bool match_binary(const Instruction* inst, BinaryOp op, const Instruction*& lhs, const Instruction*& rhs);

// A block holding exactly one instruction stands for that instruction.
const Instruction* unwrap_block(const Instruction* inst);

// Flattens a left-associated logic.and chain into its leaf conditions,
// left to right. A non-and root yields a single condition.
llvm::SmallVector<const Instruction*, 8> unpack_logic_and_chain(const Instruction* root);

} // namespace recsyn::il::match
