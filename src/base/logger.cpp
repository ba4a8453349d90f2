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

#include "logger.h"

#include <cstdio>
#include <stdexcept>

namespace Tightrope {

Logger *Logger::msSingleton = nullptr;

//------------------------------------------------------
Logger::Logger() : mCurrentLevel(LOG_LEVEL_INFO) {
    if (msSingleton)
        throw std::logic_error("Logger: only one instance may exist");

    msSingleton = this;
}

//------------------------------------------------------
Logger::~Logger() {
    mListeners.clear();
    msSingleton = nullptr;
}

//------------------------------------------------------
void Logger::log(LogLevel level, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, fmt, args);
    va_end(args);
}

//------------------------------------------------------
void Logger::vlog(LogLevel level, const char *fmt, va_list args) {
    if (level > mCurrentLevel || mListeners.empty())
        return;

    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, args);

    std::string msg(buf);

    LogListenerSet::iterator it = mListeners.begin();
    for (; it != mListeners.end(); ++it)
        (*it)->logMessage(level, msg);
}

//------------------------------------------------------
void Logger::registerLogListener(LogListener *listener) {
    mListeners.insert(listener);
}

//------------------------------------------------------
void Logger::unregisterLogListener(LogListener *listener) {
    mListeners.erase(listener);
}

//------------------------------------------------------
Logger &Logger::getSingleton() {
    if (!msSingleton)
        throw std::logic_error("Logger: no instance constructed");

    return *msSingleton;
}

//------------------------------------------------------
Logger *Logger::getSingletonPtr() { return msSingleton; }

//------------------------------------------------------
const char *Logger::levelName(LogLevel level) {
    switch (level) {
    case LOG_LEVEL_FATAL:
        return "FATAL";
    case LOG_LEVEL_ERROR:
        return "ERROR";
    case LOG_LEVEL_INFO:
        return "INFO";
    case LOG_LEVEL_DEBUG:
        return "DEBUG";
    case LOG_LEVEL_VERBOSE:
        return "VERBOSE";
    }
    return "?";
}

} // namespace Tightrope
