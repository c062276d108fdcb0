#pragma once
#include <memory>
#include <chrono>
#include <mutex>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
    static std::shared_ptr<Logger> InitializeLogger(const std::string &fileName, bool toShow);
    static void UnInitializeLogger(std::shared_ptr<Logger> &l);

    std::string filename;
    static std::shared_ptr<Logger> logger;
    static std::recursive_mutex loggerMutex;
    std::shared_ptr<spdlog::logger> spdLogger;
    bool toShow {false};

public:
    // empty fname -> console only
    Logger(const std::string &fname, bool toShow);
    ~Logger();
    static bool showThreadID;
    static bool verbose;

    void Write(spdlog::level::level_enum level, const std::string &msg);

    static std::shared_ptr<Logger> Initialize(const std::string &fileName, bool toShow = false) {
        std::lock_guard _lock(loggerMutex);
        return logger = InitializeLogger(fileName, toShow);
    }
    static std::shared_ptr<Logger> Initialize(bool toShow = false) {
        std::lock_guard _lock(loggerMutex);
        return logger = InitializeLogger("", toShow);
    }

    static void UnInitialize() {
        std::lock_guard _lock(loggerMutex);
        UnInitializeLogger(logger);
    }
    static void logMessage(spdlog::level::level_enum level, const std::string &m) {
        std::lock_guard _lock(loggerMutex);
        if (logger) {
            logger->Write(level, m);
        } else if (level >= spdlog::level::err) {
            std::cerr << m << std::endl;
        } else
            std::cout << m << std::endl;
    }
    static bool IsLogActive() {
        std::lock_guard _lock(loggerMutex);
        return logger != nullptr;
    }
    static std::string GetThreadID();
};

extern bool ShowLog(const std::string &t);
extern void ShowLogCritical(const std::string &t);

inline bool ShowLogOnVerboseDetail(const std::string &str) {
    if (!Logger::verbose) return false;
    ShowLog(str);
    return true;
}

class LoggerTracker {
    std::chrono::steady_clock::time_point tStart;
    std::string msg;

public:
    LoggerTracker(const std::string &m, bool showOnlyEnding = true);
    ~LoggerTracker();
};

class TimeTrackerStream {
    std::chrono::steady_clock::time_point tStart;
    std::string msg;
    std::ostream &out;
    bool reportInMilliseconds;

public:
    TimeTrackerStream(const std::string &m, std::ostream &x, bool repInms = true);
    void Write(const std::string &s);
    ~TimeTrackerStream();
};
