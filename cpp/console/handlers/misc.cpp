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
#include <iostream>
using std::cout;
using std::endl;

#include "../common.hpp"
#include "../handlers.hpp"

int parseFormulas(Context& context)
{
	vector< string > arguments;
	bpo::options_description options("");
	options.add_options()
		("list", "");
	auto variables = parseOptions(context, options, arguments);
	if (arguments.empty())
	{
		fatal2(__("no formulas specified"));
	}
	bool isList = variables.count("list");

	int result = 0;
	for (const auto& argument: arguments)
	{
		try
		{
			auto formula = isList ? parseFormulaList(argument) : parseFormula(argument);
			cout << (formula ? formula->toString() : string()) << endl;
		}
		catch (SyntaxError&)
		{
			result = 1; // already reported
		}
	}
	return result;
}

int showVersions(Context& context)
{
	vector< string > arguments;
	bpo::options_description options("");
	options.add_options()
		("newest,n", "");
	auto variables = parseOptions(context, options, arguments);
	if (arguments.empty())
	{
		fatal2(__("no package names specified"));
	}
	bool newestOnly = variables.count("newest");

	auto universe = context.getUniverse();
	for (const auto& packageName: arguments)
	{
		checkPackageName(packageName);
		if (!universe->hasPackage(packageName))
		{
			fatal2(__("unable to find the package '%s'"), packageName);
		}
		for (const auto& entry: universe->getEntries(packageName))
		{
			cout << __("Package") << ": " << packageName << endl;
			cout << __("Version") << ": " << entry.version.toString() << endl;
			if (entry.formula)
			{
				cout << __("Depends") << ": " << entry.formula->toString() << endl;
			}
			cout << endl;
			if (newestOnly)
			{
				break;
			}
		}
	}
	return 0;
}

int showPackageNames(Context& context)
{
	vector< string > arguments;
	parseOptions(context, {""}, arguments);

	string prefix;
	if (!arguments.empty())
	{
		prefix = arguments[0];
		arguments.erase(arguments.begin());
	}
	checkNoExtraArguments(arguments);

	for (const auto& packageName: context.getUniverse()->getPackageNames())
	{
		if (packageName.compare(0, prefix.size(), prefix) == 0)
		{
			cout << packageName << endl;
		}
	}
	return 0;
}

int dumpConfig(Context& context)
{
	auto config = context.getConfig();

	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	checkNoExtraArguments(arguments);

	for (const auto& name: config->getScalarOptionNames())
	{
		auto value = config->getString(name);
		if (value.empty()) continue;
		cout << format2("%s \"%s\";\n", name, value);
	}

	return 0;
}
