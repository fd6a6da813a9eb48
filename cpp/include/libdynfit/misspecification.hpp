#pragma once

#include "libdynfit/cfa_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace libdynfit {

struct MisspecificationCandidate {
    std::string item;
    std::string source_factor;
    std::string target_factor;
    double magnitude{0.0};
};

// Level 0 is the true model; level k carries the first k candidates.
struct MisspecifiedModel {
    std::size_t level{0};
    CfaModelSpec spec;
    std::optional<MisspecificationCandidate> added;
};

// Cross-loading size for `item` (loading on `source`) onto `target`: .50 for
// targets with up to three indicators, down .05 per indicator to .25 from
// eight on; capped so the item's communality stays at or below .95 and
// reported to three decimals. Empty when no positive cross-loading keeps the
// communality at or below .95.
[[nodiscard]] std::optional<double> cross_loading_magnitude(const CfaModelSpec& spec,
                                                            const std::string& item,
                                                            const std::string& source,
                                                            const std::string& target);

// One candidate per free item (single loading, no residual correlation,
// admissible cross-loading magnitude), round-robin over factors with the
// weakest loadings first; each item cross-loads on the next factor in
// declaration order.
[[nodiscard]] std::vector<MisspecificationCandidate> enumerate_candidates(const CfaModelSpec& spec);

// Levels 0..factors-1, each adding one more cross-loading. Throws
// InsufficientCandidatesError when the model has too few free items.
[[nodiscard]] std::vector<MisspecifiedModel> build_misspecification_levels(const CfaModelSpec& spec);

}  // namespace libdynfit
