// src/pieces.cpp
#include "chess_sim/pieces.hpp"

namespace chess_sim {

    namespace {

        // Pawns may step one rank either way, or advance two from their home rank.
        // Neither direction nor file is checked.
        bool pawn_shape(const move& mv, colour side) {
            if (mv.y_diff() == 1) return true;
            if (side == colour::white) return mv.from().y == 1 && mv.to().y == 3;
            return mv.from().y == 6 && mv.to().y == 4;
        }

        bool rook_shape(const move& mv) {
            return mv.x_diff() == 0 || mv.y_diff() == 0;
        }

        bool knight_shape(const move& mv) {
            return (mv.x_diff() == 1 && mv.y_diff() == 2) || (mv.x_diff() == 2 && mv.y_diff() == 1);
        }

        // The zero guard keeps horizontal, vertical and null moves out of the diagonal rule
        bool bishop_shape(const move& mv) {
            return mv.x_diff() != 0 && mv.x_diff() == mv.y_diff();
        }

        bool king_shape(const move& mv) {
            return mv.x_diff() <= 1 && mv.y_diff() <= 1;
        }

    } // namespace

    colour opposite(colour c) {
        return c == colour::white ? colour::black : colour::white;
    }

    bool piece::operator==(const piece& other) const { return side == other.side && kind == other.kind; }

    bool shape_is_valid(piece_kind kind, const move& mv, colour side) {
        switch (kind) {
            case piece_kind::pawn:   return pawn_shape(mv, side);
            case piece_kind::rook:   return rook_shape(mv);
            case piece_kind::knight: return knight_shape(mv);
            case piece_kind::bishop: return bishop_shape(mv);
            case piece_kind::queen:  return bishop_shape(mv) || rook_shape(mv);
            case piece_kind::king:   return king_shape(mv);
        }
        return false;
    }

    char short_name(piece_kind kind) {
        switch (kind) {
            case piece_kind::pawn:   return 'p';
            case piece_kind::rook:   return 'r';
            case piece_kind::knight: return 'n';
            case piece_kind::bishop: return 'b';
            case piece_kind::queen:  return 'q';
            case piece_kind::king:   return 'k';
        }
        return '?';
    }

} // namespace chess_sim
