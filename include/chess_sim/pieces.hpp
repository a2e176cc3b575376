#ifndef CHESS_SIM_PIECES_HPP
#define CHESS_SIM_PIECES_HPP

#include "chess_sim/geometry.hpp"

#include <array>
#include <cstdint>

namespace chess_sim {

    enum class colour : std::int8_t { white, black };
    enum class piece_kind : std::int8_t { pawn, rook, knight, bishop, queen, king };

    constexpr std::array<piece_kind, 6> all_piece_kinds = {
        piece_kind::pawn, piece_kind::rook, piece_kind::knight,
        piece_kind::bishop, piece_kind::queen, piece_kind::king
    };

    colour opposite(colour c);

    struct piece {
        colour side = colour::white;
        piece_kind kind = piece_kind::pawn;
        bool operator==(const piece& other) const;
    };

    /**
     * @brief Whether the displacement of a move matches the movement pattern of a piece kind.
     * Ignores every other piece on the board. Only the pawn rule reads the colour.
     * @param kind The kind of the moving piece.
     * @param mv The move being tested.
     * @param side The colour of the moving piece.
     * @return True if the shape is valid for this kind.
     */
    bool shape_is_valid(piece_kind kind, const move& mv, colour side);

    // One character code: p, r, n, b, q, k
    char short_name(piece_kind kind);

} // namespace chess_sim

#endif // CHESS_SIM_PIECES_HPP
