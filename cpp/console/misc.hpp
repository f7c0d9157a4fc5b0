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
#ifndef MISC_SEEN
#define MISC_SEEN

#include "common.hpp"

#include <functional>

#include <boost/program_options.hpp>
namespace bpo = boost::program_options;

class Context
{
	shared_ptr< Config > __config;
	shared_ptr< const Universe > __universe;
 public:
	shared_ptr< Config > getConfig();
	shared_ptr< const Universe > getUniverse();

	vector< string > unparsed;
};

typedef std::function< int (Context&) > Handler;

struct Command
{
	const char* name;
	Handler handler;
	const char* description; // not localized yet
};
const vector< Command >& getCommands();
Handler getHandler(const string&);

string parseCommonOptions(int argc, char** argv, Config&, vector< string >& unparsed);
bpo::variables_map parseOptions(const Context& context, bpo::options_description options,
		vector< string >& arguments);

void checkNoExtraArguments(const vector< string >& arguments);

// "A", "A {>= \"1.0\"}" or "\"A\" {>= \"1.0\"}"
pair< string, vector< Constraint > > parseRequest(const string& request);

// exit codes besides 0 (success) and 1 (error)
struct ExitCodes
{
	enum Type { Unsatisfiable = 2, Cancelled = 3 };
};

#endif
