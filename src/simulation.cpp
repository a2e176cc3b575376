// src/simulation.cpp
#include "chess_sim/simulation.hpp"
#include "chess_sim/display.hpp"
#include "chess_sim/errors.hpp"
#include "log_macros.hpp"

#include <istream>
#include <ostream>
#include <sstream>
#include <string>

namespace chess_sim {

    std::vector<move> default_move_script() {
        return {
            move{{0, 1}, {0, 3}},
            move{{1, 1}, {1, 2}},
            move{{0, 0}, {0, 2}}
        };
    }

    std::vector<move> parse_move_script(std::istream& in) {
        std::vector<move> script;
        std::string line;
        int line_number = 0;

        while (std::getline(in, line)) {
            ++line_number;

            auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos || line[first] == '#') continue;

            std::istringstream fields(line);
            int fx, fy, tx, ty;
            std::string trailing;
            if (!(fields >> fx >> fy >> tx >> ty) || (fields >> trailing)) {
                throw script_parse_error("Line " + std::to_string(line_number) + ": expected 'fx fy tx ty', got '" + line + "'");
            }
            script.push_back(move{{fx, fy}, {tx, ty}});
        }
        return script;
    }

    simulation_result run_simulation(const board& start, const std::vector<move>& script, std::ostream& out) {
        simulation_result result{start, {}};
        result.outcomes.reserve(script.size());

        out << result.final_board << '\n';

        for (const auto& mv : script) {
            if (!in_bounds(mv.from()) || !in_bounds(mv.to())) {
                LOG_ERROR("Move " << mv << " leaves the board, skipping");
                result.outcomes.push_back(move_outcome::malformed);
                continue;
            }

            auto mover = result.final_board.occupied_at(mv.from());
            if (!mover) {
                LOG_WARN("No piece at the start of " << mv << ", skipping");
                result.outcomes.push_back(move_outcome::skipped);
                continue;
            }

            bool valid = result.final_board.is_valid_move(*mover, mv.to());
            out << mv << " is valid " << (valid ? "true" : "false") << '\n';

            if (valid) {
                result.final_board = result.final_board.move_piece(*mover, mv.to());
                out << result.final_board << '\n';
                result.outcomes.push_back(move_outcome::applied);
            } else {
                result.outcomes.push_back(move_outcome::rejected);
            }
        }
        return result;
    }

} // namespace chess_sim
