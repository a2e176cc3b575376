// src/check_evaluator.cpp
#include "chess_sim/check_evaluator.hpp"
#include "chess_sim/errors.hpp"

#include <string>

namespace chess_sim {

    namespace {
        const char* colour_name(colour side) {
            return side == colour::white ? "white" : "black";
        }
    }

    std::vector<occupied_square> squares_that_can_take(const board& b, const occupied_square& target) {
        std::vector<occupied_square> attackers;
        for (const auto& os : b.occupied_squares(opposite(target.occupant.side))) {
            if (b.is_valid_move(os, target.where)) attackers.push_back(os);
        }
        return attackers;
    }

    occupied_square find_king(const board& b, colour side) {
        auto kings = b.occupied_squares(side, piece_kind::king);
        if (kings.empty()) {
            throw missing_king_error(std::string("No ") + colour_name(side) + " king on the board");
        }
        return kings.front();
    }

    bool is_in_check(const board& b, colour side) {
        return !squares_that_can_take(b, find_king(b, side)).empty();
    }

    bool king_cannot_move(const board& b, colour side) {
        occupied_square king = find_king(b, side);

        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -1; dy <= 1; ++dy) {
                if (dx == 0 && dy == 0) continue;
                location target{king.where.x + dx, king.where.y + dy};
                if (!in_bounds(target) || !b.is_valid_move(king, target)) continue;

                board after = b.move_piece(king, target);
                if (squares_that_can_take(after, {king.occupant, target}).empty()) return false;
            }
        }
        return true;
    }

    bool is_in_checkmate(const board& b, colour side) {
        return is_in_check(b, side) && king_cannot_move(b, side);
    }

} // namespace chess_sim
