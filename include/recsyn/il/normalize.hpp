#pragma once

#include <optional>

#include "recsyn/il/instructions.hpp"

namespace recsyn::il {

// Minimal cleanup run on every freshly lowered body:
//  - blocks of a container reached only through one unconditional `br` are
//    spliced into their predecessor, so straight-line code lands in the entry block;
//  - `nop` statements are dropped from blocks;
//  - a container reduced to a single block is replaced by that block.
// Locals are neither renamed nor re-typed.
InstPtr normalize(const InstPtr& body);

// Normalizes `fn.body` and exposes its entry block. Empty when the body is
// neither a block nor a container.
std::optional<NormalizedBody> normalize_function(Function fn);

} // namespace recsyn::il
