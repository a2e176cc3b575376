#ifndef CHESS_SIM_GEOMETRY_HPP
#define CHESS_SIM_GEOMETRY_HPP

#include <vector>

namespace chess_sim {

    constexpr int board_size = 8;

    // x is the file (0 = a), y is the rank (0 = rank 1)
    struct location {
        int x = 0;
        int y = 0;
        bool operator==(const location& other) const;
    };

    bool in_bounds(location where);

    /**
     * @brief A displacement from one location to another.
     * Any two locations are accepted, including identical ones and locations off the board.
     * The intermediate squares are computed once on construction.
     */
    class move {
    public:
        move(location from, location to);

        location from() const { return from_; }
        location to() const { return to_; }

        int x_diff() const { return x_diff_; }
        int y_diff() const { return y_diff_; }

        /**
         * @brief Locations strictly between from() and to().
         * Only rank, file and diagonal displacements have any; every other shape has an empty path,
         * as does any move with an endpoint off the board.
         */
        const std::vector<location>& path() const { return path_; }

        bool operator==(const move& other) const;

    private:
        location from_;
        location to_;
        int x_diff_;
        int y_diff_;
        std::vector<location> path_;
    };

} // namespace chess_sim

#endif // CHESS_SIM_GEOMETRY_HPP
