#include "star_miner/schemas/families.hpp"

namespace star_miner {

// ============================================================================
// GenericFamily implementation
// ============================================================================

PreconditionResult GenericFamily::test_preconditions(const Board& board,
                                                     const Window& /*window*/) const {
    PreconditionResult result;
    result.holds = !board.regions().empty();
    return result;
}

std::vector<ClueConfiguration> GenericFamily::generate_configurations(
    const Board& /*board*/, const Window& /*window*/,
    const PreconditionResult& /*precondition*/, int /*stars_per_unit*/) const {
    return std::vector<ClueConfiguration>(1);
}

} // namespace star_miner
