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
#include <csignal>
#include <iostream>
using std::cout;
using std::endl;

#include "../common.hpp"
#include "../handlers.hpp"

namespace {

volatile sig_atomic_t interruptRequested = 0;

void requestInterrupt(int)
{
	interruptRequested = 1;
}

void setInterruptHandler(void (*handler)(int))
{
	struct sigaction action;
	action.sa_handler = handler;
	if (sigemptyset(&action.sa_mask) == -1)
	{
		fatal2e(__("%s() failed"), "sigemptyset");
	}
	action.sa_flags = SA_RESTART;
	if (sigaction(SIGINT, &action, NULL) == -1)
	{
		fatal2e(__("%s() failed"), "sigaction");
	}
}

void printSelection(const Selection& selection)
{
	for (const auto& item: selection)
	{
		cout << "  " << item.first << ' ' << item.second.toString() << endl;
	}
}

void printGraph(const Universe& universe, const Selection& selection)
{
	for (const auto& node: getDependencyGraph(universe, selection))
	{
		if (node.second.empty()) continue;
		cout << "  " << node.first << " -> " << join(", ", node.second) << endl;
	}
}

Resolver::Result resolveFromContext(Context& context, const string& request)
{
	auto config = context.getConfig();
	auto universe = context.getUniverse();
	auto parsedRequest = parseRequest(request);

	interruptRequested = 0;
	setInterruptHandler(requestInterrupt);
	auto result = Resolver(*config).resolve(*universe, parsedRequest.first, parsedRequest.second,
			[]() -> bool { return interruptRequested; });
	setInterruptHandler(SIG_DFL);

	return result;
}

}

int resolveRequest(Context& context)
{
	vector< string > arguments;
	bpo::options_description options("");
	options.add_options()
		("no-graph", "");
	auto variables = parseOptions(context, options, arguments);
	if (arguments.empty())
	{
		fatal2(__("no request specified"));
	}
	auto request = arguments[0];
	arguments.erase(arguments.begin());
	checkNoExtraArguments(arguments);

	auto config = context.getConfig();
	if (variables.count("no-graph"))
	{
		config->setScalar("pkgformula::console::show-graph", "no");
	}

	auto result = resolveFromContext(context, request);
	switch (result.outcome)
	{
		case Resolver::Outcome::Solved:
			cout << __("Selection:") << endl;
			printSelection(result.selection);
			if (config->getBool("pkgformula::console::show-graph"))
			{
				cout << __("Dependencies:") << endl;
				printGraph(*context.getUniverse(), result.selection);
			}
			return 0;
		case Resolver::Outcome::Exhausted:
			cout << __("No solution found: ") << result.conflict.toString() << endl;
			if (!result.conflict.partialSelection.empty())
			{
				cout << __("Partial selection:") << endl;
				printSelection(result.conflict.partialSelection);
			}
			return ExitCodes::Unsatisfiable;
		case Resolver::Outcome::Cancelled:
			warn2(__("the resolving was cancelled"));
			return ExitCodes::Cancelled;
	}
	fatal2i("unknown resolver outcome %d", int(result.outcome));
	return 1; // unreachable
}

int findDependencyChain(Context& context)
{
	vector< string > arguments;
	parseOptions(context, {""}, arguments);
	if (arguments.size() < 2)
	{
		fatal2(__("a request and a package name should be specified"));
	}
	auto request = arguments[0];
	auto target = arguments[1];
	arguments.erase(arguments.begin(), arguments.begin() + 2);
	checkNoExtraArguments(arguments);
	checkPackageName(target);

	auto result = resolveFromContext(context, request);
	if (!result.isSolved())
	{
		fatal2(__("unable to resolve the request '%s'"), request);
	}
	if (!result.selection.contains(target))
	{
		cout << format2(__("the package '%s' is not selected"), target) << endl;
		return 0;
	}

	auto universe = context.getUniverse();
	auto root = parseRequest(request).first;
	auto chain = getDependencyChain(*universe, result.selection, root, target);
	if (chain.empty())
	{
		cout << format2(__("the package '%s' is not reachable from '%s'"), target, root) << endl;
		return 0;
	}
	for (size_t i = 0; i + 1 < chain.size(); ++i)
	{
		const auto& from = chain[i];
		const auto& to = chain[i+1];
		cout << format2("%s %s: %s %s", from, result.selection.get(from)->toString(),
				to, result.selection.get(to)->toString()) << endl;
	}
	return 0;
}
