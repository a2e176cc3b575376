// include/chess_sim/c_api.hpp
#ifndef CHESS_SIM_C_API_HPP
#define CHESS_SIM_C_API_HPP

#include <cstddef> // For std::size_t

// Define CHESS_SIM_API based on platform (simplified)
#ifdef _WIN32
    #define CHESS_SIM_API __declspec(dllexport)
#else
    #define CHESS_SIM_API __attribute__((visibility("default")))
#endif

// Use extern "C" to prevent C++ name mangling for C API functions
extern "C" {

    // Every function reports through one of these.
    // An illegal move is SIM_OK with a false result, never an error status.
    enum sim_status {
        SIM_OK = 0,
        SIM_ERROR_NULL_ARGUMENT = 1,
        SIM_ERROR_OUT_OF_RANGE = 2,   // A coordinate outside 0..7
        SIM_ERROR_NO_PIECE = 3,       // The source square of a move is empty
        SIM_ERROR_MISSING_KING = 4,   // Check asked for a side with no king
        SIM_ERROR_INVALID_ENUM = 5,   // Colour or piece kind value not recognised
        SIM_ERROR_INTERNAL = 6
    };

    // Colour values: 0 = white, 1 = black
    // Piece kind values: 0 = pawn, 1 = rook, 2 = knight, 3 = bishop, 4 = queen, 5 = king

    // --- Handle Management ---
    /**
     * @brief Creates a simulator holding the standard starting position.
     * @return Opaque handle, or nullptr on allocation failure.
     */
    CHESS_SIM_API void* sim_create() noexcept;

    /**
     * @brief Creates a simulator holding an empty board.
     * @return Opaque handle, or nullptr on allocation failure.
     */
    CHESS_SIM_API void* sim_create_empty() noexcept;

    CHESS_SIM_API void sim_destroy(void* handle) noexcept;

    // Back to the starting position
    CHESS_SIM_API sim_status sim_reset(void* handle) noexcept;

    // Remove every piece
    CHESS_SIM_API sim_status sim_clear(void* handle) noexcept;

    // --- Board Editing ---
    CHESS_SIM_API sim_status sim_add_piece(void* handle, int colour, int kind, int x, int y) noexcept;
    CHESS_SIM_API sim_status sim_remove_piece(void* handle, int x, int y) noexcept;

    /**
     * @brief Reads the square at (x, y).
     * @param has_piece Set to false for an empty square; colour and kind are then left untouched.
     */
    CHESS_SIM_API sim_status sim_piece_at(void* handle, int x, int y, bool* has_piece, int* colour, int* kind) noexcept;

    // --- Moves ---
    /**
     * @brief Tests whether the piece on (fx, fy) may move to (tx, ty).
     * @param valid Receives the legality result.
     * @return SIM_ERROR_NO_PIECE if the source square is empty.
     */
    CHESS_SIM_API sim_status sim_is_valid_move(void* handle, int fx, int fy, int tx, int ty, bool* valid) noexcept;

    /**
     * @brief Applies the move if it is legal; leaves the board unchanged otherwise.
     * @param applied Receives whether the board changed.
     */
    CHESS_SIM_API sim_status sim_apply_move(void* handle, int fx, int fy, int tx, int ty, bool* applied) noexcept;

    // --- Check ---
    CHESS_SIM_API sim_status sim_is_in_check(void* handle, int colour, bool* result) noexcept;
    CHESS_SIM_API sim_status sim_is_in_checkmate(void* handle, int colour, bool* result) noexcept;

    // --- Rendering ---
    /**
     * @brief Writes the text rendering of the board into buffer.
     * @return True on success. False for null arguments, or when the buffer is too small
     * (the text is then truncated and NUL-terminated).
     */
    CHESS_SIM_API bool sim_board_to_str(void* handle, char* buffer, std::size_t buffer_size) noexcept;

} // extern "C"

#endif // CHESS_SIM_C_API_HPP
