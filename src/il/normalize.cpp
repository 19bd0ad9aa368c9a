#include "recsyn/il/normalize.hpp"
#include <type_traits>
#include <unordered_map>

namespace recsyn::il {

namespace {

// Drops nops; returns the input pointer when nothing changed.
InstPtr strip_nops(const InstPtr& block_inst){
    auto* block = as<Block>(block_inst);
    if(!block) return block_inst;
    bool any = false;
    for(auto& i : block->instructions) if(as<Nop>(i)){ any = true; break; }
    if(!any) return block_inst;
    Block out; out.label = block->label;
    for(auto& i : block->instructions) if(!as<Nop>(i)) out.instructions.push_back(i);
    return make(std::move(out));
}

void count_branches(const Instruction* inst, std::unordered_map<std::string, int>& counts){
    if(!inst) return;
    std::visit([&](auto&& n){
        using T = std::decay_t<decltype(n)>;
        if constexpr(std::is_same_v<T, Branch>){ ++counts[n.target]; }
        else if constexpr(std::is_same_v<T, Block>){ for(auto& i : n.instructions) count_branches(i.get(), counts); }
        else if constexpr(std::is_same_v<T, IfInstruction>){
            count_branches(n.condition.get(), counts); count_branches(n.true_inst.get(), counts); count_branches(n.false_inst.get(), counts);
        }
        else if constexpr(std::is_same_v<T, BlockContainer>){
            // nested containers own their own labels
        }
    }, inst->data);
}

InstPtr merge_container(const BlockContainer& c){
    if(c.blocks.empty()) return nullptr;
    std::unordered_map<std::string, const Block*> by_label;
    std::unordered_map<std::string, int> incoming;
    for(auto& b : c.blocks){
        if(auto* blk = as<Block>(b)){ by_label[blk->label] = blk; count_branches(b.get(), incoming); }
    }
    auto* entry = as<Block>(c.blocks.front());
    if(!entry) return nullptr;

    Block merged; merged.label = entry->label;
    merged.instructions = entry->instructions;
    std::unordered_map<std::string, bool> consumed{{entry->label, true}};
    for(;;){
        if(merged.instructions.empty()) break;
        auto* br = as<Branch>(merged.instructions.back());
        if(!br) break;
        auto it = by_label.find(br->target);
        if(it == by_label.end() || consumed[br->target] || incoming[br->target] != 1) break;
        consumed[br->target] = true;
        merged.instructions.pop_back();
        for(auto& i : it->second->instructions) merged.instructions.push_back(i);
    }

    std::vector<InstPtr> rest;
    for(auto& b : c.blocks){
        auto* blk = as<Block>(b);
        if(blk && consumed[blk->label]) continue;
        rest.push_back(strip_nops(b));
    }
    InstPtr head = strip_nops(make(std::move(merged)));
    if(rest.empty()) return head;
    BlockContainer out;
    out.blocks.push_back(head);
    for(auto& r : rest) out.blocks.push_back(r);
    return make(std::move(out));
}

} // namespace

InstPtr normalize(const InstPtr& body){
    if(!body) return body;
    if(auto* c = as<BlockContainer>(body)) return merge_container(*c);
    if(as<Block>(body)) return strip_nops(body);
    return body;
}

std::optional<NormalizedBody> normalize_function(Function fn){
    fn.body = normalize(fn.body);
    const Block* entry = nullptr;
    if(auto* c = as<BlockContainer>(fn.body)) entry = c->blocks.empty() ? nullptr : as<Block>(c->blocks.front());
    else entry = as<Block>(fn.body);
    if(!entry) return std::nullopt;
    NormalizedBody out;
    out.function = std::make_shared<const Function>(std::move(fn));
    // nodes are heap-owned by the shared body, so the entry address survives the move
    out.entry = entry;
    return out;
}

} // namespace recsyn::il
