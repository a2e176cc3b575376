// src/display.cpp
#include "chess_sim/display.hpp"

#include <cctype>
#include <ostream>
#include <sstream>

namespace chess_sim {

    char square_code(const square& sq) {
        auto os = as_occupied(sq);
        if (!os) return '-';

        char code = short_name(os->occupant.kind);
        return os->occupant.side == colour::black ? static_cast<char>(std::toupper(static_cast<unsigned char>(code))) : code;
    }

    std::string to_string(const board& b) {
        std::stringstream ss;
        for (int y = 0; y < board_size; ++y) {
            for (int x = 0; x < board_size; ++x) {
                if (x > 0) ss << ',';
                ss << square_code(b.square_at({x, y}));
            }
            ss << '\n';
        }
        return ss.str();
    }

    std::string to_string(const move& mv) {
        std::stringstream ss;
        ss << '(' << mv.from().x << ',' << mv.from().y << ")-(" << mv.to().x << ',' << mv.to().y << ')';
        return ss.str();
    }

    std::ostream& operator<<(std::ostream& os, const board& b) { return os << to_string(b); }
    std::ostream& operator<<(std::ostream& os, const move& mv) { return os << to_string(mv); }

} // namespace chess_sim
