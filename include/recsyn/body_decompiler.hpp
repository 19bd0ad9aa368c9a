#pragma once
#include <optional>

#include "recsyn/cancellation.hpp"
#include "recsyn/il/instructions.hpp"

namespace recsyn {

// Produces the normalized body of a method on demand. Implementations must
// return a fresh tree per call and std::nullopt for methods without a body
// (abstract/extern) or with an invalid id.
class BodyDecompiler {
public:
    virtual ~BodyDecompiler() = default;
    virtual std::optional<il::NormalizedBody> decompile(MethodId method, const CancellationToken& token) = 0;
};

} // namespace recsyn
