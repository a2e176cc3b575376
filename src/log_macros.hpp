#ifndef CHESS_SIM_LOG_MACROS_HPP
#define CHESS_SIM_LOG_MACROS_HPP

#include <iostream>

// Simple logging macros
#define LOG_INFO(msg) std::cout << "[INFO] " << msg << std::endl
#define LOG_WARN(msg) std::cerr << "[WARN] " << msg << std::endl
#define LOG_ERROR(msg) std::cerr << "[ERROR] " << msg << std::endl

#endif // CHESS_SIM_LOG_MACROS_HPP
