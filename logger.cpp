#include <filesystem>
#include <iostream>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "logger.h"

static constexpr const char *loggerName = "rid_logger";

// small, stable per-thread numbers are easier to follow in a log than native thread ids
static std::size_t GetThreadIndex(const std::thread::id id) {
    static std::mutex my_mutex;
    static std::size_t nextindex = 0;
    static std::unordered_map<std::thread::id, std::size_t> ids;
    std::lock_guard<std::mutex> lock(my_mutex);
    auto iter = ids.find(id);
    if (iter == ids.end())
        return ids[id] = nextindex++;
    return iter->second;
}

bool Logger::showThreadID = true;
bool Logger::verbose = false;

Logger::Logger(const std::string &fname, bool s) : filename(fname), toShow(s) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (!fname.empty()) {
            auto dir = std::filesystem::path(fname).parent_path();
            if (!dir.empty())
                std::filesystem::create_directories(dir);

            // Daily rotating file sink (rotates at midnight, keeps 10 files)
            auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(fname, 0, 0, false, 10);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        if (toShow || fname.empty()) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            sinks.push_back(console_sink);
        }

        spdLogger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
        spdLogger->set_level(spdlog::level::trace);
        spdLogger->set_pattern("%Y-%m-%d %H:%M:%S.%f %^%l%$: %v");
        spdLogger->flush_on(spdlog::level::info);
        spdlog::drop(loggerName);
        spdlog::register_logger(spdLogger);

    } catch (const spdlog::spdlog_ex &e) {
        std::cerr << "Logger initialize error: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error &e) {
        std::cerr << "Logger initialize error: " << e.what() << std::endl;
    }
}

Logger::~Logger() {
    if (spdLogger) {
        spdLogger->flush();
        spdlog::drop(loggerName);
    }
}

std::string Logger::GetThreadID() {
    auto idx = GetThreadIndex(std::this_thread::get_id());
    return fmt::format("{:03d}", idx);
}

std::shared_ptr<Logger> Logger::InitializeLogger(const std::string &fileName, bool toShow) {
    auto l = std::make_shared<Logger>(fileName, toShow);
    return l;
}

void Logger::UnInitializeLogger(std::shared_ptr<Logger> &l) {
    l.reset();
}

void Logger::Write(spdlog::level::level_enum level, const std::string &msg) {
    if (!spdLogger) {
        std::cout << msg << std::endl;
        return;
    }
    if (showThreadID)
        spdLogger->log(level, "[{}] {}", GetThreadID(), msg);
    else
        spdLogger->log(level, "{}", msg);
}

std::shared_ptr<Logger> Logger::logger;
std::recursive_mutex Logger::loggerMutex;

bool ShowLog(const std::string &t) {
    Logger::logMessage(spdlog::level::info, t);
    return Logger::IsLogActive();
}

void ShowLogCritical(const std::string &t) {
    Logger::logMessage(spdlog::level::critical, t);
}

LoggerTracker::LoggerTracker(const std::string &m, bool showOnlyEnding) : msg(m) {
    tStart = std::chrono::steady_clock::now();
    if (!showOnlyEnding) {
        ShowLog(fmt::format("{} started.", msg));
    }
}
LoggerTracker::~LoggerTracker() {
    auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - tStart);
    ShowLog(fmt::format("{} completed. Elapsed {} ms.", msg, ts.count()));
}

TimeTrackerStream::TimeTrackerStream(const std::string &m, std::ostream &x, bool repInms) : msg(m),
                                                                                            out(x),
                                                                                            reportInMilliseconds(repInms) {
    tStart = std::chrono::steady_clock::now();
    out << msg << " started.\n";
}
void TimeTrackerStream::Write(const std::string &s) {
    auto ts = std::chrono::steady_clock::now() - tStart;
    out << fmt::format("{} Elapsed in {}.", s, reportInMilliseconds ? (std::chrono::duration_cast<std::chrono::milliseconds>(ts)).count() : (std::chrono::duration_cast<std::chrono::seconds>(ts)).count()) << '\n';
}
TimeTrackerStream::~TimeTrackerStream() {
    auto ts = std::chrono::steady_clock::now() - tStart;
    out << fmt::format("{} Completed in {}.", msg, reportInMilliseconds ? (std::chrono::duration_cast<std::chrono::milliseconds>(ts)).count() : (std::chrono::duration_cast<std::chrono::seconds>(ts)).count()) << '\n';
}
