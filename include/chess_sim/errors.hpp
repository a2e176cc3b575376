#ifndef CHESS_SIM_ERRORS_HPP
#define CHESS_SIM_ERRORS_HPP

#include <stdexcept>

namespace chess_sim {

    // A location outside the 8x8 board reached a board access.
    // Callers are expected to validate coordinates before building moves.
    class invalid_location_error : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
    };

    // Check and checkmate need exactly one king of the side being asked about
    class missing_king_error : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    class script_parse_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace chess_sim

#endif // CHESS_SIM_ERRORS_HPP
