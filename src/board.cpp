// src/board.cpp
#include "chess_sim/board.hpp"
#include "chess_sim/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace chess_sim {

    namespace {

        void require_in_bounds(location where) {
            if (!in_bounds(where)) {
                throw invalid_location_error("Location (" + std::to_string(where.x) + "," + std::to_string(where.y) + ") is off the board");
            }
        }

    } // namespace

    // --- Squares ---
    bool empty_square::operator==(const empty_square& other) const { return where == other.where; }
    bool occupied_square::operator==(const occupied_square& other) const { return occupant == other.occupant && where == other.where; }

    location location_of(const square& sq) {
        return std::visit([](const auto& s) { return s.where; }, sq);
    }

    std::optional<occupied_square> as_occupied(const square& sq) {
        if (const auto* os = std::get_if<occupied_square>(&sq)) return *os;
        return std::nullopt;
    }

    // --- Construction ---
    board::board() {
        // The empty files never change, every empty board shares the same eight
        static const file_array empty_files = [] {
            file_array files;
            for (int x = 0; x < board_size; ++x) {
                auto column = std::make_shared<file_column>();
                for (int y = 0; y < board_size; ++y) (*column)[y] = empty_square{{x, y}};
                files[x] = std::move(column);
            }
            return files;
        }();
        files_ = empty_files;
    }

    board::board(file_array files) : files_(std::move(files)) {}

    board board::starting_position() {
        const std::array<piece_kind, board_size> back_rank = {
            piece_kind::rook, piece_kind::knight, piece_kind::bishop, piece_kind::queen,
            piece_kind::king, piece_kind::bishop, piece_kind::knight, piece_kind::rook
        };

        board result;
        for (int x = 0; x < board_size; ++x) {
            result = result.add_piece({colour::white, piece_kind::pawn}, {x, 1})
                           .add_piece({colour::black, piece_kind::pawn}, {x, 6})
                           .add_piece({colour::white, back_rank[x]}, {x, 0})
                           .add_piece({colour::black, back_rank[x]}, {x, 7});
        }
        return result;
    }

    // --- Queries ---
    template <class Predicate>
    std::vector<occupied_square> board::find_pieces(Predicate predicate) const {
        std::vector<occupied_square> found;
        for (const auto& column : files_) {
            for (const auto& sq : *column) {
                if (const auto* os = std::get_if<occupied_square>(&sq); os && predicate(*os)) {
                    found.push_back(*os);
                }
            }
        }
        return found;
    }

    std::vector<occupied_square> board::occupied_squares(colour side) const {
        return find_pieces([side](const occupied_square& os) { return os.occupant.side == side; });
    }

    std::vector<occupied_square> board::occupied_squares(colour side, piece_kind kind) const {
        return find_pieces([side, kind](const occupied_square& os) {
            return os.occupant.side == side && os.occupant.kind == kind;
        });
    }

    const square& board::square_at(location where) const {
        require_in_bounds(where);
        return (*files_[where.x])[where.y];
    }

    std::optional<piece> board::piece_at(location where) const {
        if (const auto* os = std::get_if<occupied_square>(&square_at(where))) return os->occupant;
        return std::nullopt;
    }

    std::optional<occupied_square> board::occupied_at(location where) const {
        return as_occupied(square_at(where));
    }

    // --- Legality ---
    bool board::pieces_in_the_way(const occupied_square& mover, location destination) const {
        if (mover.occupant.kind == piece_kind::knight) return false;

        move mv{mover.where, destination};
        return std::ranges::any_of(mv.path(), [this](location l) { return piece_at(l).has_value(); });
    }

    bool board::same_colour_at_target(const occupied_square& mover, location destination) const {
        auto target = piece_at(destination);
        return target && target->side == mover.occupant.side;
    }

    bool board::is_valid_move(const occupied_square& mover, location destination) const {
        require_in_bounds(mover.where);
        require_in_bounds(destination);

        move mv{mover.where, destination};
        return shape_is_valid(mover.occupant.kind, mv, mover.occupant.side) &&
               !pieces_in_the_way(mover, destination) &&
               !same_colour_at_target(mover, destination);
    }

    // --- Mutation ---
    board board::with_square(const square& replacement) const {
        location where = location_of(replacement);
        require_in_bounds(where);

        auto column = std::make_shared<file_column>(*files_[where.x]);
        (*column)[where.y] = replacement;

        file_array files = files_;
        files[where.x] = std::move(column);
        return board{std::move(files)};
    }

    board board::add_piece(piece p, location where) const {
        return with_square(occupied_square{p, where});
    }

    board board::remove_piece(const occupied_square& os) const {
        return with_square(empty_square{os.where});
    }

    board board::move_piece(const occupied_square& os, location destination) const {
        return remove_piece(os).add_piece(os.occupant, destination);
    }

    bool board::operator==(const board& other) const {
        for (int x = 0; x < board_size; ++x) {
            if (files_[x] == other.files_[x]) continue;
            if (*files_[x] != *other.files_[x]) return false;
        }
        return true;
    }

} // namespace chess_sim
