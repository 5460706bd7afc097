#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <format>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include "scopeview_config.h"

// ============================================================================
// ASYNC LOGGING UTILITY
// ============================================================================

class Logger {
private:
    FILE* logFile = nullptr;
    std::mutex queueMutex;
    std::condition_variable queueCV;
    std::queue<std::string> logQueue;
    std::thread loggerThread;
    std::atomic<bool> running{ false };
    std::atomic<bool> initialized{ false };

    void WorkerThread() {
        std::unique_lock<std::mutex> lock(queueMutex);
        while (running || !logQueue.empty()) {
            queueCV.wait(lock, [this] { return !logQueue.empty() || !running; });

            while (!logQueue.empty()) {
                std::string msg = std::move(logQueue.front());
                logQueue.pop();

                // Release lock while writing so producers are never blocked on file I/O
                lock.unlock();
                if (logFile) {
                    std::fprintf(logFile, "%s\n", msg.c_str());
                }
                lock.lock();
            }

            if (logFile) std::fflush(logFile);
        }
    }

public:
    Logger() = default;

    ~Logger() {
        Close();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& Instance() {
        static Logger instance;
        return instance;
    }

    bool Initialize(const char* filename = SCOPEVIEW_LOG_FILE) {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (initialized) return true;

        logFile = std::fopen(filename, "w");
        if (!logFile) return false;

        logQueue.push("[INIT] [INFO] ==============================================");
        logQueue.push(std::format("[INIT] [INFO] scopeview v{} Initialized (Async)", SCOPEVIEW_VERSION));
        logQueue.push("[INIT] [INFO] ==============================================");

        running = true;
        initialized = true;
        loggerThread = std::thread(&Logger::WorkerThread, this);
        return true;
    }

    bool IsInitialized() const { return initialized; }

    void Log(std::string_view level, std::string_view message) {
        if (!initialized || !ENABLE_LOGGING) return;

        std::time_t t = std::time(nullptr);
        std::tm tmInfo{};
        localtime_r(&t, &tmInfo);
        char timeBuf[32];
        std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmInfo);

        std::string fullMessage = std::format("[{}] [{}] {}", timeBuf, level, message);
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            logQueue.push(std::move(fullMessage));
        }
        queueCV.notify_one();
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (!running) return;
            running = false;
        }
        queueCV.notify_all();

        // Worker drains the queue before it exits
        if (loggerThread.joinable()) {
            loggerThread.join();
        }

        if (logFile) {
            std::fprintf(logFile, "[INFO] Logger shutting down.\n");
            std::fclose(logFile);
            logFile = nullptr;
        }
        initialized = false;
    }
};

int GetLogVerbosity();

#define LOG_INFO(fmt, ...)  do { if (GetLogVerbosity() >= 1) Logger::Instance().Log("INFO", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while (0)
#define LOG_WARN(fmt, ...)  do { if (GetLogVerbosity() >= 1) Logger::Instance().Log("WARN", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while (0)
#define LOG_ERROR(fmt, ...) do { Logger::Instance().Log("ERROR", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while (0)

#if LOG_VERBOSE
#define LOG_DEBUG(fmt, ...) do { if (GetLogVerbosity() >= 2) Logger::Instance().Log("DEBUG", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while (0)
#else
#define LOG_DEBUG(fmt, ...) ((void)0)
#endif
