#include <chess_sim/board.hpp>
#include <chess_sim/check_evaluator.hpp>
#include <chess_sim/errors.hpp>
#include <chess_sim/simulation.hpp>

#include "log_macros.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) { // Optional command-line argument for a move script
    std::vector<chess_sim::move> script;

    // --- Get the move script from the command line or use the default ---
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [path_to_move_script]" << std::endl;
        return 1;
    }
    if (argc == 2) {
        std::string script_path = argv[1];
        std::ifstream file(script_path);
        if (!file) {
            LOG_ERROR("Could not open move script: " << script_path);
            return 1;
        }
        try {
            script = chess_sim::parse_move_script(file);
        } catch (const chess_sim::script_parse_error& e) {
            LOG_ERROR("Invalid move script " << script_path << ": " << e.what());
            return 1;
        } catch (const std::exception& e) {
            LOG_ERROR("Could not read move script " << script_path << ": " << e.what());
            return 1;
        }
        LOG_INFO("Using move script from command line: " << script_path << " (" << script.size() << " moves)");
    } else {
        script = chess_sim::default_move_script();
    }
    // --- End move script handling ---

    try {
        auto result = chess_sim::run_simulation(chess_sim::board::starting_position(), script, std::cout);

        for (auto side : {chess_sim::colour::white, chess_sim::colour::black}) {
            const char* name = side == chess_sim::colour::white ? "White" : "Black";
            std::cout << name << " in check: " << std::boolalpha << chess_sim::is_in_check(result.final_board, side)
                      << ", in checkmate: " << chess_sim::is_in_checkmate(result.final_board, side) << std::endl;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Simulation failed: " << e.what());
        return 1;
    }

    return 0;
}
