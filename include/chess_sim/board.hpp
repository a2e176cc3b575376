#ifndef CHESS_SIM_BOARD_HPP
#define CHESS_SIM_BOARD_HPP

#include "chess_sim/geometry.hpp"
#include "chess_sim/pieces.hpp"

#include <array>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace chess_sim {

    // --- Squares ---
    struct empty_square {
        location where;
        bool operator==(const empty_square& other) const;
    };

    struct occupied_square {
        piece occupant;
        location where;
        bool operator==(const occupied_square& other) const;
    };

    using square = std::variant<empty_square, occupied_square>;

    location location_of(const square& sq);
    std::optional<occupied_square> as_occupied(const square& sq);

    /**
     * @brief An immutable 8x8 board, indexed [x][y].
     *
     * Every operation that changes the position returns a new board and leaves this one untouched.
     * Files (columns) are shared between snapshots, so a mutation only copies the files it touches.
     *
     * Any location outside the board passed to a query or mutation throws invalid_location_error.
     */
    class board {
    public:
        // All 64 squares empty
        board();

        /**
         * @brief The standard starting array.
         * White occupies ranks y = 0 and 1, black ranks y = 6 and 7.
         */
        static board starting_position();

        // --- Queries ---
        // Scan order is file-major: x outer, y inner
        std::vector<occupied_square> occupied_squares(colour side) const;
        std::vector<occupied_square> occupied_squares(colour side, piece_kind kind) const;

        const square& square_at(location where) const;
        std::optional<piece> piece_at(location where) const;
        std::optional<occupied_square> occupied_at(location where) const;

        // --- Legality ---
        // True if any square strictly between the mover and destination holds a piece. Knights jump.
        bool pieces_in_the_way(const occupied_square& mover, location destination) const;
        bool same_colour_at_target(const occupied_square& mover, location destination) const;

        /**
         * @brief Shape, obstruction and target occupancy combined.
         * A capture is legal and is not reported differently from a quiet move.
         * A null move is illegal since the mover occupies its own destination.
         * @throws invalid_location_error if the mover or destination is off the board.
         */
        bool is_valid_move(const occupied_square& mover, location destination) const;

        // --- Mutation ---
        board add_piece(piece p, location where) const;
        board remove_piece(const occupied_square& os) const;

        /**
         * @brief Moves the piece to the destination without checking legality.
         * Whatever stood on the destination is replaced. Call is_valid_move first.
         */
        board move_piece(const occupied_square& os, location destination) const;

        bool operator==(const board& other) const;

    private:
        using file_column = std::array<square, board_size>;
        using file_array = std::array<std::shared_ptr<const file_column>, board_size>;

        explicit board(file_array files);

        board with_square(const square& replacement) const;

        template <class Predicate>
        std::vector<occupied_square> find_pieces(Predicate predicate) const;

        file_array files_;
    };

} // namespace chess_sim

#endif // CHESS_SIM_BOARD_HPP
