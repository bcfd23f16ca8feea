// Console logging shared by every gpgrab module.
//
// Use like LOGI("found " << name << " (" << address << ")");
// Errors go to stderr, everything else to stdout.

#ifndef GPGRAB_LOG_H
#define GPGRAB_LOG_H

#include <sstream>
#include <string>

namespace gpgrab {

enum class LogLevel { Debug = 0, Info, Warn, Error };

void setLogLevel(LogLevel level);
bool logEnabled(LogLevel level);

void logWrite(LogLevel level, const std::string& text);

// Single-line progress output (carriage-return refreshed). Any log line
// written while a progress line is open terminates it first.
void progressUpdate(const std::string& text);
void progressEnd();

} // namespace gpgrab

#define GPGRAB_LOG(lvl, expr) \
    do { \
        if (gpgrab::logEnabled(lvl)) { \
            std::ostringstream _oss; _oss << expr; \
            gpgrab::logWrite(lvl, _oss.str()); \
        } \
    } while (0)

#define LOGD(expr) GPGRAB_LOG(gpgrab::LogLevel::Debug, expr)
#define LOGI(expr) GPGRAB_LOG(gpgrab::LogLevel::Info, expr)
#define LOGW(expr) GPGRAB_LOG(gpgrab::LogLevel::Warn, expr)
#define LOGE(expr) GPGRAB_LOG(gpgrab::LogLevel::Error, expr)

#endif // GPGRAB_LOG_H
