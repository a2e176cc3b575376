// src/c_api.cpp
#include "chess_sim/c_api.hpp"
#include "chess_sim/board.hpp"
#include "chess_sim/check_evaluator.hpp"
#include "chess_sim/display.hpp"
#include "chess_sim/errors.hpp"

#include <cstring>
#include <exception>
#include <iostream>
#include <new>
#include <optional>
#include <string>
#include <utility>

// Owns the snapshot the host is currently looking at
struct SimulatorHandle {
    chess_sim::board current_board;
};

namespace {

    std::optional<chess_sim::colour> to_colour(int value) {
        if (value == 0) return chess_sim::colour::white;
        if (value == 1) return chess_sim::colour::black;
        return std::nullopt;
    }

    std::optional<chess_sim::piece_kind> to_kind(int value) {
        if (value < 0 || value >= static_cast<int>(chess_sim::all_piece_kinds.size())) return std::nullopt;
        return chess_sim::all_piece_kinds[value];
    }

    // Runs body with the handle, turning exceptions into status codes so nothing crosses the C boundary
    template <class Body>
    sim_status guarded(const char* function_name, void* handle_opaque, Body&& body) noexcept {
        if (!handle_opaque) {
            std::cerr << "[C API ERROR] " << function_name << " called with null handle." << std::endl;
            return SIM_ERROR_NULL_ARGUMENT;
        }
        auto* handle = static_cast<SimulatorHandle*>(handle_opaque);
        try {
            return body(*handle);
        } catch (const chess_sim::invalid_location_error& e) {
            std::cerr << "[C API ERROR] " << function_name << ": " << e.what() << std::endl;
            return SIM_ERROR_OUT_OF_RANGE;
        } catch (const chess_sim::missing_king_error& e) {
            std::cerr << "[C API ERROR] " << function_name << ": " << e.what() << std::endl;
            return SIM_ERROR_MISSING_KING;
        } catch (const std::exception& e) {
            std::cerr << "[C API ERROR] Exception in " << function_name << ": " << e.what() << std::endl;
            return SIM_ERROR_INTERNAL;
        } catch (...) {
            std::cerr << "[C API ERROR] Unknown exception in " << function_name << "." << std::endl;
            return SIM_ERROR_INTERNAL;
        }
    }

    SimulatorHandle* create_handle(chess_sim::board initial) noexcept {
        try {
            auto* handle = new(std::nothrow) SimulatorHandle{std::move(initial)};
            if (handle) std::cout << "[C API] Simulator created." << std::endl;
            return handle;
        } catch (const std::exception& e) {
            std::cerr << "[C API ERROR] Exception creating simulator: " << e.what() << std::endl;
            return nullptr;
        }
    }

} // namespace

extern "C" {

    // --- Handle Management ---
    CHESS_SIM_API void* sim_create() noexcept {
        try {
            return create_handle(chess_sim::board::starting_position());
        } catch (const std::exception& e) {
            std::cerr << "[C API ERROR] Exception building the starting position: " << e.what() << std::endl;
            return nullptr;
        }
    }

    CHESS_SIM_API void* sim_create_empty() noexcept {
        return create_handle(chess_sim::board{});
    }

    CHESS_SIM_API void sim_destroy(void* handle) noexcept {
        if (handle) {
            std::cout << "[C API] sim_destroy called." << std::endl;
            delete static_cast<SimulatorHandle*>(handle);
        } else {
            std::cerr << "[C API WARNING] sim_destroy called with null handle." << std::endl;
        }
    }

    CHESS_SIM_API sim_status sim_reset(void* handle) noexcept {
        return guarded("sim_reset", handle, [](SimulatorHandle& h) {
            h.current_board = chess_sim::board::starting_position();
            return SIM_OK;
        });
    }

    CHESS_SIM_API sim_status sim_clear(void* handle) noexcept {
        return guarded("sim_clear", handle, [](SimulatorHandle& h) {
            h.current_board = chess_sim::board{};
            return SIM_OK;
        });
    }

    // --- Board Editing ---
    CHESS_SIM_API sim_status sim_add_piece(void* handle, int colour, int kind, int x, int y) noexcept {
        return guarded("sim_add_piece", handle, [=](SimulatorHandle& h) {
            auto side = to_colour(colour);
            auto piece_kind = to_kind(kind);
            if (!side || !piece_kind) return SIM_ERROR_INVALID_ENUM;

            h.current_board = h.current_board.add_piece({*side, *piece_kind}, {x, y});
            return SIM_OK;
        });
    }

    CHESS_SIM_API sim_status sim_remove_piece(void* handle, int x, int y) noexcept {
        return guarded("sim_remove_piece", handle, [=](SimulatorHandle& h) {
            auto os = h.current_board.occupied_at({x, y});
            if (!os) return SIM_ERROR_NO_PIECE;

            h.current_board = h.current_board.remove_piece(*os);
            return SIM_OK;
        });
    }

    CHESS_SIM_API sim_status sim_piece_at(void* handle, int x, int y, bool* has_piece, int* colour, int* kind) noexcept {
        if (!has_piece || !colour || !kind) return SIM_ERROR_NULL_ARGUMENT;
        return guarded("sim_piece_at", handle, [=](SimulatorHandle& h) {
            auto p = h.current_board.piece_at({x, y});
            *has_piece = p.has_value();
            if (p) {
                *colour = static_cast<int>(p->side);
                *kind = static_cast<int>(p->kind);
            }
            return SIM_OK;
        });
    }

    // --- Moves ---
    CHESS_SIM_API sim_status sim_is_valid_move(void* handle, int fx, int fy, int tx, int ty, bool* valid) noexcept {
        if (!valid) return SIM_ERROR_NULL_ARGUMENT;
        return guarded("sim_is_valid_move", handle, [=](SimulatorHandle& h) {
            auto mover = h.current_board.occupied_at({fx, fy});
            if (!mover) return SIM_ERROR_NO_PIECE;

            *valid = h.current_board.is_valid_move(*mover, {tx, ty});
            return SIM_OK;
        });
    }

    CHESS_SIM_API sim_status sim_apply_move(void* handle, int fx, int fy, int tx, int ty, bool* applied) noexcept {
        if (!applied) return SIM_ERROR_NULL_ARGUMENT;
        return guarded("sim_apply_move", handle, [=](SimulatorHandle& h) {
            auto mover = h.current_board.occupied_at({fx, fy});
            if (!mover) return SIM_ERROR_NO_PIECE;

            *applied = h.current_board.is_valid_move(*mover, {tx, ty});
            if (*applied) h.current_board = h.current_board.move_piece(*mover, {tx, ty});
            return SIM_OK;
        });
    }

    // --- Check ---
    CHESS_SIM_API sim_status sim_is_in_check(void* handle, int colour, bool* result) noexcept {
        if (!result) return SIM_ERROR_NULL_ARGUMENT;
        return guarded("sim_is_in_check", handle, [=](SimulatorHandle& h) {
            auto side = to_colour(colour);
            if (!side) return SIM_ERROR_INVALID_ENUM;

            *result = chess_sim::is_in_check(h.current_board, *side);
            return SIM_OK;
        });
    }

    CHESS_SIM_API sim_status sim_is_in_checkmate(void* handle, int colour, bool* result) noexcept {
        if (!result) return SIM_ERROR_NULL_ARGUMENT;
        return guarded("sim_is_in_checkmate", handle, [=](SimulatorHandle& h) {
            auto side = to_colour(colour);
            if (!side) return SIM_ERROR_INVALID_ENUM;

            *result = chess_sim::is_in_checkmate(h.current_board, *side);
            return SIM_OK;
        });
    }

    // --- Rendering ---
    CHESS_SIM_API bool sim_board_to_str(void* handle, char* buffer, std::size_t buffer_size) noexcept {
        if (!handle || !buffer || buffer_size == 0) return false;
        auto* h = static_cast<SimulatorHandle*>(handle);
        try {
            std::string text = chess_sim::to_string(h->current_board);
            if (text.length() < buffer_size) {
                std::memcpy(buffer, text.c_str(), text.length() + 1);
                return true;
            }
            std::memcpy(buffer, text.c_str(), buffer_size - 1);
            buffer[buffer_size - 1] = '\0';
            std::cerr << "[C API WARNING] sim_board_to_str: Buffer too small for " << text.length() << " characters" << std::endl;
            return false;
        } catch (const std::exception& e) {
            std::cerr << "[C API ERROR] Exception during sim_board_to_str: " << e.what() << std::endl;
            buffer[0] = '\0';
            return false;
        }
    }

} // extern "C"
