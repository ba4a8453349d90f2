/******************************************************************************
 *
 *    This file is part of Tightrope
 *    Copyright (C) 2024-2026 Tightrope contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

#ifndef __LOGGER_H
#define __LOGGER_H

#include <cstdarg>
#include <set>
#include <string>

namespace Tightrope {

class LogListener;

/** Central logger. Construct exactly one instance (usually on the stack of
 * main()); everything else reaches it through getSingleton(). Messages are
 * formatted printf-style and dispatched to all registered listeners whose
 * level filter passes.
 */
class Logger {
public:
    /// Log levels, from most to least severe
    typedef enum {
        LOG_LEVEL_FATAL = 0,
        LOG_LEVEL_ERROR,
        LOG_LEVEL_INFO,
        LOG_LEVEL_DEBUG,
        LOG_LEVEL_VERBOSE
    } LogLevel;

    Logger();
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    /// Formats and dispatches a message
    void log(LogLevel level, const char *fmt, ...);

    /// va_list variant of log()
    void vlog(LogLevel level, const char *fmt, va_list args);

    void registerLogListener(LogListener *listener);
    void unregisterLogListener(LogListener *listener);

    /// Messages less severe than this level are dropped
    void setLogLevel(LogLevel level) { mCurrentLevel = level; }
    LogLevel getLogLevel() const { return mCurrentLevel; }

    static Logger &getSingleton();
    static Logger *getSingletonPtr();

    static const char *levelName(LogLevel level);

private:
    typedef std::set<LogListener *> LogListenerSet;

    LogListenerSet mListeners;
    LogLevel mCurrentLevel;

    static Logger *msSingleton;
};

/** Log sink interface. */
class LogListener {
public:
    virtual ~LogListener() = default;

    virtual void logMessage(Logger::LogLevel level, const std::string &msg) = 0;
};

} // namespace Tightrope

// Convenience macros. They are no-ops while no Logger instance exists, so
// library code can log unconditionally (tests usually run without a logger).
#define TIGHTROPE_LOG(level, ...)                                            \
    do {                                                                     \
        ::Tightrope::Logger *_lg = ::Tightrope::Logger::getSingletonPtr();   \
        if (_lg)                                                             \
            _lg->log(level, __VA_ARGS__);                                    \
    } while (0)

#define LOG_FATAL(...)   TIGHTROPE_LOG(::Tightrope::Logger::LOG_LEVEL_FATAL, __VA_ARGS__)
#define LOG_ERROR(...)   TIGHTROPE_LOG(::Tightrope::Logger::LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_INFO(...)    TIGHTROPE_LOG(::Tightrope::Logger::LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_DEBUG(...)   TIGHTROPE_LOG(::Tightrope::Logger::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_VERBOSE(...) TIGHTROPE_LOG(::Tightrope::Logger::LOG_LEVEL_VERBOSE, __VA_ARGS__)

#endif // __LOGGER_H
