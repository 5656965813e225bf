#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string>
#include <fstream>
#include <mutex>

class Logger {
public:
    enum Level {
        DEBUG = 0,
        INFO,
        WARNING,
        ERROR
    };

    static Logger & getInstance();

    // log info level message
    void info(const std::string & message);

    // log warning level message
    void warning(const std::string & message);

    // log debug level message
    void debug(const std::string & message);

    // log error level message
    void error(const std::string & message);

    // same as above, tagged with a request id
    void info(int id, const std::string & message);
    void warning(int id, const std::string & message);
    void debug(int id, const std::string & message);
    void error(int id, const std::string & message);

    // get current time
    std::string getCurrentTime();

    // open one file per level under path (path is used as a prefix)
    void setLogPath(const std::string & path);

    // echo to stdout, on by default
    void setConsole(bool enabled);

    // messages below this level are dropped, DEBUG by default
    void setLevel(Level level);

    ~Logger();

private:
    std::ofstream logFileInfo;
    std::ofstream logFileWarning;
    std::ofstream logFileDebug;
    std::ofstream logFileError;
    std::mutex mtx;
    bool isInitialized;
    bool console;
    Level minLevel;

    Logger() : isInitialized(false), console(true), minLevel(DEBUG) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void closeFiles();

    // write one line to the console and to every file at or below level
    void log(Level level, const std::string & prefix, const std::string & message);
};

#endif
