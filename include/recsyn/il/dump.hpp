#pragma once

#include <string>

#include <llvm/Support/raw_ostream.h>

#include "recsyn/il/instructions.hpp"

namespace recsyn::il {

// ILAst-style text, e.g.
//   callvirt Append(ldloc builder, ldstr "X = ")
//   leave (ldc.i4 1)
// Blocks and containers are printed one statement per line.
void dump(llvm::raw_ostream& os, const TypeSystem& ts, const Instruction& inst, unsigned indent = 0);
void dump(llvm::raw_ostream& os, const TypeSystem& ts, const NormalizedBody& body);
std::string to_string(const TypeSystem& ts, const Instruction& inst);

} // namespace recsyn::il
