/**************************************************************************
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
#include <clocale>
#include <cstring>
#include <initializer_list>
#include <iostream>
using std::cout;
using std::endl;

#include <unistd.h>

#include "pkgformula.hpp"

#define PKGFORMULA_QUOTED_(x) # x
#define PKGFORMULA_QUOTED(x) PKGFORMULA_QUOTED_(x)

namespace {

bool isSpelledAs(const char* argument, std::initializer_list< const char* > spellings)
{
	for (auto spelling: spellings)
	{
		if (!strcmp(argument, spelling))
		{
			return true;
		}
	}
	return false;
}

void printVersions()
{
	cout << format2("pkgformula %s, libpkgformula %s",
			PKGFORMULA_QUOTED(PKGFORMULA_VERSION), libraryVersion) << endl;
}

void printUsage(const char* argv0)
{
	static const pair< const char*, const char* > commonOptions[] = {
		{ "-r, --repository <directory>", N__("opam repository to load the packages from") },
		{ "-c, --config <file>", N__("reads an additional configuration file") },
		{ "-o, --option <name>=<value>", N__("sets a configuration option") },
		{ "-q, --quiet", N__("suppresses the standard output") },
		{ "--debug", N__("traces resolver decisions to the standard error") },
	};

	cout << format2(__("Usage: %s [<common options>] <command> [<arguments>]"), argv0) << endl;
	cout << endl << __("Commands:") << endl;
	for (const auto& command: getCommands())
	{
		cout << format2("  %-12s %s", command.name, __(command.description)) << endl;
	}
	cout << format2("  %-12s %s", "help", __("prints this text")) << endl;
	cout << format2("  %-12s %s", "version", __("prints versions of the program and the library")) << endl;

	cout << endl << __("Common options:") << endl;
	for (const auto& option: commonOptions)
	{
		cout << format2("  %-30s %s", option.first, __(option.second)) << endl;
	}

	cout << endl << __("Exit codes:") << endl;
	cout << format2("  %d: %s", 0, __("success")) << endl;
	cout << format2("  %d: %s", 1, __("error")) << endl;
	cout << format2("  %d: %s", int(ExitCodes::Unsatisfiable), __("no solution for the request")) << endl;
	cout << format2("  %d: %s", int(ExitCodes::Cancelled), __("resolving was interrupted")) << endl;
}

}

int main(int argc, char* argv[])
{
	setlocale(LC_ALL, "");
	messageFd = STDERR_FILENO;

	// no command at all means 'help'
	const char* first = (argc > 1) ? argv[1] : "help";
	bool wantsHelp = isSpelledAs(first, { "help", "--help", "-h" });
	if (wantsHelp || isSpelledAs(first, { "version", "--version", "-v" }))
	{
		if (argc > 2)
		{
			warn2(__("the command '%s' doesn't accept arguments"), first);
		}
		if (wantsHelp)
		{
			printUsage(argv[0]);
		}
		else
		{
			printVersions();
		}
		return 0;
	}

	Context context;
	return mainEx(argc, argv, context);
}

int mainEx(int argc, char* argv[], Context& context)
{
	string command;
	Handler handler;
	try
	{
		command = parseCommonOptions(argc, argv, *context.getConfig(), context.unparsed);
		handler = getHandler(command);
	}
	catch (Exception&)
	{
		return 1;
	}

	try
	{
		return handler(context);
	}
	catch (Exception&)
	{
		// the cause is already printed
		__mwrite_line("E: ", format2(__("error performing the command '%s'"), command));
		return 1;
	}
}
