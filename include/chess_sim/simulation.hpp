#ifndef CHESS_SIM_SIMULATION_HPP
#define CHESS_SIM_SIMULATION_HPP

#include "chess_sim/board.hpp"
#include "chess_sim/geometry.hpp"

#include <cstdint>
#include <iosfwd>
#include <vector>

namespace chess_sim {

    enum class move_outcome : std::int8_t {
        applied,   // legal, board updated
        rejected,  // illegal, board unchanged
        skipped,   // nothing on the source square
        malformed  // a coordinate is off the board
    };

    struct simulation_result {
        board final_board;
        std::vector<move_outcome> outcomes; // One per scripted move, in order
    };

    // The three demonstration moves played from the starting position
    std::vector<move> default_move_script();

    /**
     * @brief Reads one move per line as four integers: fx fy tx ty.
     * Blank lines and lines starting with '#' are ignored. Coordinates are not range checked here.
     * @throws script_parse_error naming the first malformed line.
     */
    std::vector<move> parse_move_script(std::istream& in);

    /**
     * @brief Plays a script of moves from a starting board, printing as it goes.
     *
     * Prints the starting board, then for each move "<move> is valid <true|false>".
     * After every applied move the new board is printed. Each board is followed by a blank line.
     * Moves whose source square is empty are skipped; moves off the board are reported and skipped.
     * No turn order is enforced.
     */
    simulation_result run_simulation(const board& start, const std::vector<move>& script, std::ostream& out);

} // namespace chess_sim

#endif // CHESS_SIM_SIMULATION_HPP
