#include "Log.h"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace gpgrab {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_logMutex;
static bool g_progressOpen = false;
static size_t g_progressWidth = 0;

static const char* levelLabel(LogLevel lvl)
{
    switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARNING";
    case LogLevel::Error: return "ERROR";
    }
    return "LOG";
}

static std::string timestamp()
{
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

void setLogLevel(LogLevel level)
{
    g_level = static_cast<int>(level);
}

bool logEnabled(LogLevel level)
{
    return static_cast<int>(level) >= g_level.load();
}

// Must be called with g_logMutex held.
static void closeProgressLocked()
{
    if (g_progressOpen) {
        std::cout << "\n";
        std::cout.flush();
        g_progressOpen = false;
        g_progressWidth = 0;
    }
}

void logWrite(LogLevel level, const std::string& text)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    closeProgressLocked();
    std::ostream& os = (level == LogLevel::Error) ? std::cerr : std::cout;
    os << timestamp() << " - " << levelLabel(level) << " - " << text << "\n";
    os.flush();
}

void progressUpdate(const std::string& text)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::string line = text;
    // pad so a shorter line fully overwrites the previous one
    if (line.size() < g_progressWidth) line.append(g_progressWidth - line.size(), ' ');
    std::cout << "\r" << line;
    std::cout.flush();
    g_progressOpen = true;
    g_progressWidth = text.size();
}

void progressEnd()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    closeProgressLocked();
}

} // namespace gpgrab
