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
#ifndef PKGFORMULA_CONFIG_SEEN
#define PKGFORMULA_CONFIG_SEEN

/// @file

#include <sys/types.h>

#include <pkgformula/common.hpp>

namespace pkgformula {

namespace internal {

struct ConfigImpl;

}

/// stores library's configuration variables
/**
 * All options are scalar and have a default value. Option names are case
 * insensitive.
 *
 * Used options:
 *  - @c debug::resolver: trace resolver decisions to the message descriptor;
 *  - @c debug::logger: duplicate log lines to the message descriptor;
 *  - @c pkgformula::resolver::max-steps: the limit of resolver steps, @c 0 means no limit;
 *  - @c pkgformula::log::enable, @c pkgformula::log::levels::*: the session log;
 *  - @c pkgformula::directory::*: paths, relative ones are relative to their parent option;
 *  - @c pkgformula::repository: default repository directory for the console;
 *  - @c pkgformula::console::show-graph: print the resolved dependency graph;
 *  - @c quiet: suppress non-essential console output.
 */
class PKGFORMULA_API Config
{
	internal::ConfigImpl* __impl;
 public:
	/// constructor
	/**
	 * Initializes options with default values and reads configuration files:
	 * every file in the @c pkgformula::directory::configuration::main-parts
	 * directory and then @c pkgformula::directory::configuration::main (or
	 * the file named by the @c PKGFORMULA_CONFIG environment variable).
	 * Missing files are not an error.
	 */
	Config();
	/// destructor
	virtual ~Config();
	/// copy constructor
	Config(const Config& other);
	/// assignment operator
	Config& operator=(const Config& other);

	/// reads a configuration file
	/**
	 * @param path path to the file
	 * @throw Exception if the file cannot be opened or parsed
	 */
	void readFile(const string& path);
	/// reads configuration from a string
	/**
	 * @param text configuration text
	 * @throw Exception on syntax errors
	 */
	void readText(const string& text);

	/// returns scalar option names
	vector< string > getScalarOptionNames() const;

	/// sets new value for the scalar option
	/**
	 * Unknown options are ignored with a warning.
	 *
	 * @param optionName name of the option to modify
	 * @param value new value for the option
	 */
	void setScalar(const string& optionName, const string& value);

	/// gets the option value
	/**
	 * @throw Exception for unknown options
	 */
	string getString(const string& optionName) const;
	/// gets the option value as a path
	/**
	 * A relative path is prefixed by the path of the parent option, if it exists.
	 */
	string getPath(const string& optionName) const;
	/// gets the option value as a boolean
	/**
	 * Empty values, @c "no", @c "false" and @c "0" are @c false, anything else is @c true.
	 */
	bool getBool(const string& optionName) const;
	/// gets the option value as an integer
	/**
	 * @throw Exception if the value is not a number
	 */
	ssize_t getInteger(const string& optionName) const;
};

} // namespace

#endif
