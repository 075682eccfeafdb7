#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#endif

// Process-wide log file ([Main] Logging=0/1, LogLevel=0..3 in settings.ini).
// Log() is called from the hook callback: when logging is off, or the level
// is filtered, it returns before touching the mutex.
class Logger {
public:

    enum Level { INFO, WARNING, ERR, CRITICAL };

    static void SetEnabled(bool enabled) { Enabled().store(enabled, std::memory_order_relaxed); }
    static bool IsEnabled()              { return Enabled().load(std::memory_order_relaxed); }

    // Messages below this level are dropped (default INFO)
    static void SetMinLevel(Level level) { MinLevel().store((int)level, std::memory_order_relaxed); }
    static Level GetMinLevel()           { return (Level)MinLevel().load(std::memory_order_relaxed); }

    static void Init(const std::filesystem::path& filename = "InputWarden_log.txt") {
        if (!IsEnabled()) return;
        std::lock_guard<std::mutex> lock(Mutex());
        if (Stream().is_open()) Stream().close();
        Stream().open(filename, std::ios::out | std::ios::trunc);
        if (!Stream().is_open()) return;
        Stream() << "[SYSTEM] === InputWarden start ===" << std::endl;
        Stream() << "[SYSTEM] Log file: " << filename.u8string()
                 << " (min level " << LevelStr(GetMinLevel()) << ")" << std::endl;
    }

    static void Close() {
        std::lock_guard<std::mutex> lock(Mutex());
        if (!Stream().is_open()) return;
        Stream() << "[SYSTEM] === InputWarden stop ===" << std::endl;
        Stream().close();
    }

    static void Log(Level level, const std::string& section, const std::string& message) {
        if (!IsEnabled() || (int)level < MinLevel().load(std::memory_order_relaxed)) return;

        std::string entry = "[" + Timestamp() + "] [" + LevelStr(level) + "] [" + section + "] " + message;

        std::lock_guard<std::mutex> lock(Mutex());
        if (!Stream().is_open()) return;
        Stream() << entry << std::endl;

#ifdef _WIN32
        OutputDebugStringA((entry + "\n").c_str());
#endif
    }

    static void Info(const std::string& section, const std::string& msg)     { Log(INFO,     section, msg); }
    static void Warn(const std::string& section, const std::string& msg)     { Log(WARNING,  section, msg); }
    static void Error(const std::string& section, const std::string& msg)    { Log(ERR,      section, msg); }
    static void Critical(const std::string& section, const std::string& msg) { Log(CRITICAL, section, msg); }

private:

    static std::atomic<bool>& Enabled()  { static std::atomic<bool> e{ false }; return e; } // off by default
    static std::atomic<int>&  MinLevel() { static std::atomic<int> l{ INFO };   return l; }

    static std::string Timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_val{};
#ifdef _WIN32
        localtime_s(&tm_val, &t);
#else
        localtime_r(&t, &tm_val);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    static const char* LevelStr(Level l) {
        switch (l) {
            case INFO:     return "INFO    ";
            case WARNING:  return "WARNING ";
            case ERR:      return "ERROR   ";
            case CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN ";
    }

    static std::ofstream& Stream() { static std::ofstream s; return s; }
    static std::mutex&    Mutex()  { static std::mutex m;    return m; }
};
