#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <stdexcept>

namespace {

const char * levelName(Logger::Level level) {
    switch (level) {
        case Logger::DEBUG: return "DEBUG";
        case Logger::INFO: return "INFO";
        case Logger::WARNING: return "WARNING";
        case Logger::ERROR: return "ERROR";
    }
    return "INFO";
}

}

// singleton get instance
Logger & Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::closeFiles() {
    if (logFileInfo.is_open()) logFileInfo.close();
    if (logFileWarning.is_open()) logFileWarning.close();
    if (logFileDebug.is_open()) logFileDebug.close();
    if (logFileError.is_open()) logFileError.close();
}

void Logger::setLogPath(const std::string & path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (isInitialized) {
        closeFiles();
        isInitialized = false;
    }

    try {
        // Create parent directory if it doesn't exist
        std::filesystem::path log_path(path);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        logFileInfo.open(path + "INFO.log", std::ios::app);
        logFileWarning.open(path + "WARNING.log", std::ios::app);
        logFileDebug.open(path + "DEBUG.log", std::ios::app);
        logFileError.open(path + "ERROR.log", std::ios::app);
        if (!logFileInfo.is_open() || !logFileWarning.is_open() ||
            !logFileDebug.is_open() || !logFileError.is_open()) {
            closeFiles();
            throw std::runtime_error("Failed to open log file: " + path);
        }
        isInitialized = true;
    }
    catch (const std::exception& e) {
        std::cerr << "Logger initialization error: " << e.what() << std::endl;
        // Continue without file logging, but with console output
        isInitialized = false;
    }
}

void Logger::setConsole(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx);
    console = enabled;
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mtx);
    minLevel = level;
}

// destructor
Logger::~Logger() {
    closeFiles();
}

void Logger::log(Level level, const std::string & prefix, const std::string & message) {
    std::lock_guard<std::mutex> lock(mtx);
    if (level < minLevel) {
        return;
    }
    std::string line = getCurrentTime() + " [" + levelName(level) + "] " + prefix + message;
    if (console) {
        std::cout << line << std::endl;
    }
    if (!isInitialized) {
        return;
    }
    // a message lands in its own file and in every more verbose one
    std::ofstream * files[] = { &logFileDebug, &logFileInfo, &logFileWarning, &logFileError };
    for (int i = 0; i <= static_cast<int>(level); i++) {
        *files[i] << line << std::endl;
        files[i]->flush();
    }
}

void Logger::info(const std::string & message) {
    log(INFO, "", message);
}

void Logger::warning(const std::string & message) {
    log(WARNING, "", message);
}

void Logger::debug(const std::string & message) {
    log(DEBUG, "", message);
}

void Logger::error(const std::string & message) {
    log(ERROR, "", message);
}

void Logger::info(int id, const std::string & message) {
    log(INFO, std::to_string(id) + ": ", message);
}

void Logger::warning(int id, const std::string & message) {
    log(WARNING, std::to_string(id) + ": ", message);
}

void Logger::debug(int id, const std::string & message) {
    log(DEBUG, std::to_string(id) + ": ", message);
}

void Logger::error(int id, const std::string & message) {
    log(ERROR, std::to_string(id) + ": ", message);
}

std::string Logger::getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&in_time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
