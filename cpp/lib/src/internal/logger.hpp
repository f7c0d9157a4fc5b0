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
#ifndef PKGFORMULA_INTERNAL_LOGGER_SEEN
#define PKGFORMULA_INTERNAL_LOGGER_SEEN

#include <cstdint>

#include <pkgformula/fwd.hpp>
#include <pkgformula/common.hpp>

namespace pkgformula {
namespace internal {

// writes timestamped lines to the session log, if enabled
class Logger
{
 public:
	typedef uint16_t Level;
	enum class Subsystem { Session, Resolver };

	Logger(const Config& config);
	~Logger();
	void log(Subsystem, Level, const string& message, bool force = false);
 private:
	Level __levels[2];
	File* __file;
	bool __enabled;
	bool __debugging;

	string __get_log_string(Subsystem, Level, const string& message);

	static const char* __subsystem_strings[2];
};

}
}

#endif
