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

#ifndef __STDLOG_H
#define __STDLOG_H

#include "logger.h"

#include <cstdio>

namespace Tightrope {

/** Log listener writing "[LEVEL] message" lines to a stdio stream (stderr
 * unless told otherwise). */
class StdLog : public LogListener {
public:
    explicit StdLog(FILE *stream = stderr) : mStream(stream) {}

    void logMessage(Logger::LogLevel level, const std::string &msg) override;

private:
    FILE *mStream;
};

} // namespace Tightrope

#endif // __STDLOG_H
