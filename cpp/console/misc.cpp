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
#include <cstdio>
#include <cstring>
#include <algorithm>

#include <common/regex.hpp>

#include <pkgformula/repository.hpp>

#include "common.hpp"
#include "misc.hpp"
#include "handlers.hpp"

void handleQuietOption(const Config&);

string parseCommonOptions(int argc, char** argv, Config& config, vector< string >& unparsed)
{
	string command;
	// parsing
	bpo::options_description options("Common options");
	vector< string > directOptions;
	vector< string > configFiles;
	string repository;
	options.add_options()
		("option,o", bpo::value< vector< string > >(&directOptions))
		("config,c", bpo::value< vector< string > >(&configFiles))
		("repository,r", bpo::value< string >(&repository))
		("debug", "")
		("quiet,q", "")
		("command", bpo::value< string >(&command))
		("arguments", bpo::value< vector< string > >());

	bpo::positional_options_description positionalOptions;
	positionalOptions.add("command", 1);
	positionalOptions.add("arguments", -1);

	try
	{
		bpo::variables_map variablesMap;
		bpo::parsed_options parsed = bpo::command_line_parser(argc, argv).options(options)
				.style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
				.positional(positionalOptions).allow_unregistered().run();
		bpo::store(parsed, variablesMap);
		bpo::notify(variablesMap);

		{ // do not pass 'command' further
			auto commandOptionIt = std::find_if(parsed.options.begin(), parsed.options.end(),
					[](const bpo::option& o) { return o.string_key == "command"; });
			if (commandOptionIt != parsed.options.end())
			{
				parsed.options.erase(commandOptionIt);
			}
		}
		unparsed = bpo::collect_unrecognized(parsed.options, bpo::include_positional);

		{ // processing
			if (command.empty())
			{
				fatal2(__("no command specified"));
			}
			// files first, so direct options override them
			for (const string& configFile: configFiles)
			{
				config.readFile(configFile);
			}
			if (!repository.empty())
			{
				config.setScalar("pkgformula::repository", repository);
			}
			if (variablesMap.count("debug"))
			{
				config.setScalar("debug::resolver", "yes");
			}
			if (variablesMap.count("quiet"))
			{
				config.setScalar("quiet", "yes");
			}
		}

		smatch m;
		for (const string& directOption: directOptions)
		{
			static const sregex optionRegex = sregex::compile("(.*?)=(.*)");
			if (!regex_match(directOption, m, optionRegex))
			{
				fatal2(__("invalid option syntax in '%s' (right is '<option>=<value>')"), directOption);
			}
			config.setScalar(m[1], m[2]);
		}
		handleQuietOption(config);
	}
	catch (const bpo::error& e)
	{
		fatal2(__("failed to parse command-line options: %s"), e.what());
	}
	catch (Exception&)
	{
		fatal2(__("error while processing command-line options"));
	}
	return command;
}

bpo::variables_map parseOptions(const Context& context, bpo::options_description options,
		vector< string >& arguments)
{
	bpo::options_description argumentOptions("");
	argumentOptions.add_options()
		("arguments", bpo::value< vector< string > >(&arguments));

	bpo::options_description all("");
	all.add(options);
	all.add(argumentOptions);

	bpo::positional_options_description positionalOptions;
	positionalOptions.add("arguments", -1);

	bpo::variables_map variablesMap;
	try
	{
		bpo::parsed_options parsed = bpo::command_line_parser(context.unparsed)
				.style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
				.options(all).positional(positionalOptions).run();
		bpo::store(parsed, variablesMap);
	}
	catch (const bpo::unknown_option& e)
	{
		fatal2(__("unknown option '%s'"), e.get_option_name());
	}
	catch (const bpo::error& e)
	{
		fatal2(__("failed to parse command-line options: %s"), e.what());
	}
	bpo::notify(variablesMap);

	return variablesMap;
}

const vector< Command >& getCommands()
{
	static const vector< Command > commands = {
		{ "parse", &parseFormulas, N__("checks formulas and prints them in the canonical form") },
		{ "show", &showVersions, N__("prints versions and dependencies of packages") },
		{ "pkgnames", &showPackageNames, N__("prints available package names") },
		{ "config-dump", &dumpConfig, N__("prints values of configuration variables") },
		{ "resolve", &resolveRequest, N__("computes a consistent package selection for the request") },
		{ "why", &findDependencyChain, N__("finds a dependency chain from the request to a package") },
	};
	return commands;
}

Handler getHandler(const string& name)
{
	for (const auto& command: getCommands())
	{
		if (name == command.name)
		{
			return command.handler;
		}
	}
	fatal2(__("unrecognized command '%s'"), name);
	__builtin_unreachable();
}

void checkNoExtraArguments(const vector< string >& arguments)
{
	if (!arguments.empty())
	{
		auto argumentsString = join(" ", arguments);
		warn2(__("extra arguments '%s' are not processed"), argumentsString);
	}
}

pair< string, vector< Constraint > > parseRequest(const string& request)
{
	// a bare package name may lead the request
	static const sregex bareNameRegex = sregex::compile("\\s*([A-Za-z0-9_.+-]+)(.*)");
	smatch m;
	string formulaText = request;
	if (regex_match(request, m, bareNameRegex))
	{
		formulaText = string("\"") + m[1].str() + '"' + m[2].str();
	}

	auto formula = parseFormula(formulaText);
	if (formula->type != Formula::Types::Package)
	{
		fatal2(__("the request '%s' should name a single package with optional version constraints"),
				request);
	}
	return { formula->packageName, formula->constraints };
}

void handleQuietOption(const Config& config)
{
	if (config.getBool("quiet"))
	{
		if (!freopen("/dev/null", "w", stdout))
		{
			fatal2e(__("unable to redirect standard output to '/dev/null'"));
		}
	}
}

shared_ptr< Config > Context::getConfig()
{
	if (!__config)
	{
		try
		{
			__config.reset(new Config);
		}
		catch (Exception&)
		{
			fatal2(__("error while loading the configuration"));
		}
	}
	return __config;
}

shared_ptr< const Universe > Context::getUniverse()
{
	if (!__universe)
	{
		try
		{
			auto records = readRepository(getConfig()->getString("pkgformula::repository"));
			__universe.reset(new Universe(loadUniverse(records)));
		}
		catch (Exception&)
		{
			fatal2(__("error while loading the package universe"));
		}
	}
	return __universe;
}
