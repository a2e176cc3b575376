// src/geometry.cpp
#include "chess_sim/geometry.hpp"

#include <cstdlib>
#include <limits>

namespace chess_sim {

    namespace {
        int sign(int value) {
            return (value > 0) - (value < 0);
        }

        // |a - b| without overflow, saturating at INT_MAX
        int distance(int a, int b) {
            long long diff = std::llabs(static_cast<long long>(a) - b);
            constexpr long long max_int = std::numeric_limits<int>::max();
            return static_cast<int>(diff > max_int ? max_int : diff);
        }
    }

    bool location::operator==(const location& other) const { return x == other.x && y == other.y; }

    bool in_bounds(location where) {
        return where.x >= 0 && where.x < board_size && where.y >= 0 && where.y < board_size;
    }

    move::move(location from, location to)
        : from_(from),
          to_(to),
          x_diff_(distance(from.x, to.x)),
          y_diff_(distance(from.y, to.y))
    {
        // Off-board moves are rejected by the board before any path is needed
        if (!in_bounds(from) || !in_bounds(to)) return;

        // Knight shapes and the odd pawn shapes don't lie on a line, nothing is between them
        bool straight_line = x_diff_ == 0 || y_diff_ == 0 || x_diff_ == y_diff_;
        if (!straight_line) return;

        int step_x = sign(to.x - from.x);
        int step_y = sign(to.y - from.y);
        int steps = x_diff_ > y_diff_ ? x_diff_ : y_diff_;

        path_.reserve(steps > 0 ? steps - 1 : 0);
        for (int i = 1; i < steps; ++i) {
            path_.push_back({from.x + i * step_x, from.y + i * step_y});
        }
    }

    bool move::operator==(const move& other) const { return from_ == other.from_ && to_ == other.to_; }

} // namespace chess_sim
