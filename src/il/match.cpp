#include "recsyn/il/match.hpp"

namespace recsyn::il::match {

bool match_return(const Instruction* inst, const Instruction*& value){
    auto* leave = as<Leave>(inst);
    if(!leave || !leave->exits_function) return false;
    value = leave->value.get();
    return true;
}

bool match_leave(const Instruction* inst, const Instruction*& value){
    auto* leave = as<Leave>(inst);
    if(!leave) return false;
    value = leave->value.get();
    return true;
}

bool match_nop(const Instruction* inst){ return as<Nop>(inst) != nullptr; }

bool match_ld_this(const Instruction* inst){
    auto* ld = as<LdLoc>(inst);
    return ld && ld->var && ld->var->kind == VariableKind::Parameter && ld->var->index == -1;
}

bool match_ld_loc(const Instruction* inst, VariablePtr& var){
    auto* ld = as<LdLoc>(inst);
    if(!ld) return false;
    var = ld->var;
    return true;
}

bool match_ld_loc_of(const Instruction* inst, const VariablePtr& var){
    auto* ld = as<LdLoc>(inst);
    return ld && var && ld->var == var;
}

bool match_st_loc(const Instruction* inst, VariablePtr& var, const Instruction*& value){
    auto* st = as<StLoc>(inst);
    if(!st) return false;
    var = st->var; value = st->value.get();
    return true;
}

bool match_ld_str(const Instruction* inst, std::string& text){
    auto* ld = as<LdStr>(inst);
    if(!ld) return false;
    text = ld->value;
    return true;
}

bool match_ldc_i4(const Instruction* inst, int32_t& value){
    auto* ld = as<LdcI4>(inst);
    if(!ld) return false;
    value = ld->value;
    return true;
}

bool match_ldc_i4_of(const Instruction* inst, int32_t expected){
    auto* ld = as<LdcI4>(inst);
    return ld && ld->value == expected;
}

bool match_ld_null(const Instruction* inst){ return as<LdNull>(inst) != nullptr; }

bool match_ld_fld(const Instruction* inst, const Instruction*& target, FieldRef& field){
    auto* ld = as<LdFld>(inst);
    if(!ld) return false;
    target = ld->target.get(); field = ld->field;
    return true;
}

bool match_lds_fld(const Instruction* inst, FieldRef& field){
    auto* ld = as<LdsFld>(inst);
    if(!ld) return false;
    field = ld->field;
    return true;
}

bool match_st_fld(const Instruction* inst, const Instruction*& target, FieldRef& field, const Instruction*& value){
    auto* st = as<StFld>(inst);
    if(!st) return false;
    target = st->target.get(); field = st->field; value = st->value.get();
    return true;
}

bool match_sts_fld(const Instruction* inst, FieldRef& field, const Instruction*& value){
    auto* st = as<StsFld>(inst);
    if(!st) return false;
    field = st->field; value = st->value.get();
    return true;
}

bool match_if_instruction(const Instruction* inst, const Instruction*& condition, const Instruction*& true_inst){
    auto* ifi = as<IfInstruction>(inst);
    if(!ifi) return false;
    // if-without-else only; an else branch other than nop is a different shape
    if(ifi->false_inst && !match_nop(ifi->false_inst.get())) return false;
    condition = ifi->condition.get(); true_inst = ifi->true_inst.get();
    return true;
}

bool match_logic_and(const Instruction* inst, const Instruction*& lhs, const Instruction*& rhs){
    auto* la = as<LogicAnd>(inst);
    if(!la) return false;
    lhs = la->lhs.get(); rhs = la->rhs.get();
    return true;
}

bool match_comp_not_equals_null(const Instruction* inst, const Instruction*& arg){
    auto* comp = as<Comp>(inst);
    if(!comp || comp->kind != ComparisonKind::Inequality) return false;
    if(match_ld_null(comp->rhs.get())){ arg = comp->lhs.get(); return true; }
    if(match_ld_null(comp->lhs.get())){ arg = comp->rhs.get(); return true; }
    return false;
}

bool match_binary(const Instruction* inst, BinaryOp op, const Instruction*& lhs, const Instruction*& rhs){
    auto* bin = as<BinaryNumeric>(inst);
    if(!bin || bin->op != op || bin->check_overflow) return false;
    lhs = bin->lhs.get(); rhs = bin->rhs.get();
    return true;
}

const Instruction* unwrap_block(const Instruction* inst){
    auto* block = as<Block>(inst);
    if(block && block->instructions.size() == 1) return block->instructions[0].get();
    return inst;
}

static void visit_and_chain(const Instruction* inst, llvm::SmallVectorImpl<const Instruction*>& out){
    const Instruction* lhs = nullptr;
    const Instruction* rhs = nullptr;
    if(match_logic_and(inst, lhs, rhs)){
        visit_and_chain(lhs, out);
        visit_and_chain(rhs, out);
    } else {
        out.push_back(inst);
    }
}

llvm::SmallVector<const Instruction*, 8> unpack_logic_and_chain(const Instruction* root){
    llvm::SmallVector<const Instruction*, 8> result;
    visit_and_chain(root, result);
    return result;
}

} // namespace recsyn::il::match
