#ifndef CHESS_SIM_CHECK_EVALUATOR_HPP
#define CHESS_SIM_CHECK_EVALUATOR_HPP

#include "chess_sim/board.hpp"

#include <vector>

namespace chess_sim {

    /**
     * @brief Every piece of the opposite colour that could legally move onto the target's square.
     * Uses the full legality test, so blocked lines don't count.
     * @param b The board to inspect.
     * @param target The square under attack.
     * @return The attackers in scan order.
     */
    std::vector<occupied_square> squares_that_can_take(const board& b, const occupied_square& target);

    /**
     * @brief The first king of the given colour in scan order.
     * @throws missing_king_error if that colour has no king on the board.
     */
    occupied_square find_king(const board& b, colour side);

    // @throws missing_king_error
    bool is_in_check(const board& b, colour side);

    /**
     * @brief True if the king has no adjacent square to escape to.
     * A square is an escape if the king may legally move there (empty or an enemy piece)
     * and is not attacked once it has moved.
     * @throws missing_king_error
     */
    bool king_cannot_move(const board& b, colour side);

    // In check with no king escape. Blocking or capturing the attacker with other pieces is not considered.
    bool is_in_checkmate(const board& b, colour side);

} // namespace chess_sim

#endif // CHESS_SIM_CHECK_EVALUATOR_HPP
