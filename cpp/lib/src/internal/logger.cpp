/**************************************************************************
*   Copyright (C) 2010-2011 by Eugene V. Lyubimkin                        *
*   Copyright (C) 2026 by the pkgformula developers                       *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#include <ctime>

#include <pkgformula/config.hpp>
#include <pkgformula/file.hpp>

#include <internal/filesystem.hpp>
#include <internal/logger.hpp>

namespace pkgformula {
namespace internal {

const char* Logger::__subsystem_strings[2] = {
	"session", "resolver"
};

Logger::Logger(const Config& config)
	: __file(NULL)
{
	__enabled = config.getBool("pkgformula::log::enable");
	__debugging = config.getBool("debug::logger");

	if (!__enabled)
	{
		return;
	}

	__levels[(int)Subsystem::Session] = 1;
	__levels[(int)Subsystem::Resolver] = config.getInteger(
			string("pkgformula::log::levels::") + __subsystem_strings[(int)Subsystem::Resolver]);

	auto path = config.getPath("pkgformula::directory::log");
	auto directory = fs::dirname(path);
	if (!fs::dirExists(directory))
	{
		fs::mkpath(directory);
	}
	__file = new RequiredFile(path, "a");

	log(Subsystem::Session, 1, "started");
}

Logger::~Logger()
{
	if (__file)
	{
		try
		{
			log(Subsystem::Session, 1, "finished");
		}
		catch (Exception&)
		{
			// already reported, destructors must not throw
		}
	}
	delete __file;
}

string Logger::__get_log_string(Subsystem subsystem, Level level, const string& message)
{
	char dateTime[10 + 1 + 8 + 1]; // "2011-05-20 12:34:56"
	{
		struct tm tm;
		auto timestamp = time(NULL);
		localtime_r(&timestamp, &tm);
		strftime(dateTime, sizeof(dateTime), "%F %T", &tm);
	}
	string indent((level - 1) * 2, ' ');
	return string(dateTime) + " | " + __subsystem_strings[(int)subsystem] +
			": " + indent + message;
}

void Logger::log(Subsystem subsystem, Level level, const string& message, bool force)
{
	if (level == 0)
	{
		fatal2i("logger: log: level should be >= 1");
	}

	if (!__enabled)
	{
		return;
	}

	if (__debugging)
	{
		debug2("log: %s", __get_log_string(subsystem, level, message));
	}

	if (force || (level <= __levels[(int)subsystem]))
	{
		auto logData = __get_log_string(subsystem, level, message) + "\n";
		// stdio-buffered fails when there are several writing processes
		__file->unbufferedPut(logData.c_str(), logData.size());
	}
}

}
}
