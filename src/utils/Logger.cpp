#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    std::string trimTrailingNewlines(const std::string& message) {
        std::string trimmed = message;
        while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
            trimmed.pop_back();
        }
        return trimmed;
    }
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (logFilePath.empty()) return;

    std::ofstream logFile(logFilePath, std::ios::app);
    if (!logFile.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm timeInfo;
#ifdef _WIN32
    localtime_s(&timeInfo, &now);
#else
    localtime_r(&now, &timeInfo);
#endif
    logFile << std::put_time(&timeInfo, "[%Y-%m-%d %H:%M:%S] ");
    switch (level) {
        case LogLevel::ERROR: logFile << "[ERROR] "; break;
        case LogLevel::WARNING: logFile << "[WARN] "; break;
        case LogLevel::INFO: logFile << "[INFO] "; break;
        case LogLevel::SUCCESS: logFile << "[OK] "; break;
        case LogLevel::ACTION: logFile << "[ACTION] "; break;
        case LogLevel::DEBUG: logFile << "[DEBUG] "; break;
    }
    logFile << trimTrailingNewlines(message) << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    std::string prefix;
    switch (level) {
        case LogLevel::ACTION:
            prefix = YELLOW + BOLD + "[Action] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::SUCCESS:
            prefix = GREEN + "✔ " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
    }

    // Multi-line messages (e.g. unmatched context) get the prefix on the first line only
    std::stringstream ss(trimTrailingNewlines(message));
    std::string line;
    bool first = true;
    while (std::getline(ss, line)) {
        if (first) {
            std::cerr << prefix << line << std::endl;
        } else {
            std::cerr << GRAY << "  │ " << RESET << line << std::endl;
        }
        first = false;
    }
}
