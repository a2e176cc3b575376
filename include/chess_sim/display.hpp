#ifndef CHESS_SIM_DISPLAY_HPP
#define CHESS_SIM_DISPLAY_HPP

#include "chess_sim/board.hpp"
#include "chess_sim/geometry.hpp"

#include <iosfwd>
#include <string>

namespace chess_sim {

    // '-' for an empty square, the piece code otherwise (upper case for black)
    char square_code(const square& sq);

    /**
     * @brief Renders the board one rank per line, from y = 0 to y = 7.
     * Each line holds the eight square codes for x = 0..7 separated by commas and ends with a newline.
     */
    std::string to_string(const board& b);

    // (fx,fy)-(tx,ty)
    std::string to_string(const move& mv);

    std::ostream& operator<<(std::ostream& os, const board& b);
    std::ostream& operator<<(std::ostream& os, const move& mv);

} // namespace chess_sim

#endif // CHESS_SIM_DISPLAY_HPP
