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
#include <cctype>
#include <cstdlib>
#include <map>
using std::map;

#include <boost/lexical_cast.hpp>

#include <pkgformula/common.hpp>
#include <pkgformula/config.hpp>

#include <internal/configparser.hpp>
#include <internal/filesystem.hpp>

namespace pkgformula {

namespace internal {

struct ConfigImpl
{
	map< string, string > regularVars;

	void initializeVariables();
	void readConfigs(Config*);
	void clear(const string& prefix);
	static string normalizeOptionName(const string& optionName);
};

void ConfigImpl::initializeVariables()
{
	regularVars =
	{
		{ "pkgformula::console::show-graph", "yes" },
		{ "pkgformula::directory", "/" },
		{ "pkgformula::directory::configuration", "etc/pkgformula" },
		{ "pkgformula::directory::configuration::main", "pkgformula.conf" },
		{ "pkgformula::directory::configuration::main-parts", "pkgformula.conf.d" },
		{ "pkgformula::directory::log", "var/log/pkgformula.log" },
		{ "pkgformula::log::enable", "no" },
		{ "pkgformula::log::levels::resolver", "1" },
		{ "pkgformula::repository", "." },
		{ "pkgformula::resolver::max-steps", "100000" },
		{ "quiet", "no" },
		{ "debug::logger", "no" },
		{ "debug::resolver", "no" },
	};
}

string ConfigImpl::normalizeOptionName(const string& optionName)
{
	string result = optionName;
	for (char& c: result)
	{
		c = std::tolower((unsigned char)c);
	}
	return result;
}

void ConfigImpl::clear(const string& prefix)
{
	auto normalizedPrefix = normalizeOptionName(prefix);
	for (auto& item: regularVars)
	{
		if (item.first.compare(0, normalizedPrefix.size(), normalizedPrefix) == 0)
		{
			item.second.clear();
		}
	}
}

void ConfigImpl::readConfigs(Config* config)
{
	vector< string > configFiles = internal::fs::glob(
			config->getPath("pkgformula::directory::configuration::main-parts") + "/*");

	string mainFilePath = config->getPath("pkgformula::directory::configuration::main");
	const char* envConfig = getenv("PKGFORMULA_CONFIG");
	if (envConfig)
	{
		mainFilePath = envConfig;
	}
	if (internal::fs::fileExists(mainFilePath))
	{
		configFiles.push_back(mainFilePath);
	}

	for (const auto& configFile: configFiles)
	{
		try
		{
			config->readFile(configFile);
		}
		catch (Exception&)
		{
			warn2(__("skipped the configuration file '%s'"), configFile);
		}
	}
}

}

namespace {

internal::ConfigParser __make_parser(Config* config, internal::ConfigImpl* impl)
{
	auto valueHandler = [config](const string& name, const string& value)
	{
		config->setScalar(name, value);
	};
	auto clearHandler = [impl](const string& name)
	{
		impl->clear(name);
	};
	return internal::ConfigParser(valueHandler, clearHandler);
}

}

Config::Config()
{
	__impl = new internal::ConfigImpl;
	__impl->initializeVariables();
	__impl->readConfigs(this);
}

Config::~Config()
{
	delete __impl;
}

Config::Config(const Config& other)
{
	__impl = new internal::ConfigImpl(*other.__impl);
}

Config& Config::operator=(const Config& other)
{
	if (this == &other)
	{
		return *this;
	}
	delete __impl;
	__impl = new internal::ConfigImpl(*other.__impl);
	return *this;
}

void Config::readFile(const string& path)
{
	__make_parser(this, __impl).parse(path);
}

void Config::readText(const string& text)
{
	__make_parser(this, __impl).parseText(text);
}

vector< string > Config::getScalarOptionNames() const
{
	vector< string > result;
	for (const auto& item: __impl->regularVars)
	{
		result.push_back(item.first);
	}
	return result;
}

string Config::getString(const string& optionName) const
{
	auto it = __impl->regularVars.find(internal::ConfigImpl::normalizeOptionName(optionName));
	if (it != __impl->regularVars.cend())
	{
		return it->second; // found
	}
	else
	{
		fatal2(__("an attempt to get the wrong scalar option '%s'"), optionName);
	}
	__builtin_unreachable();
}

string Config::getPath(const string& optionName) const
{
	auto shallowResult = getString(optionName);
	if (!shallowResult.empty() && shallowResult[0] != '/')
	{
		// relative path -> combine with prefix

		// let's see if we have a prefix
		auto doubleColonPosition = optionName.rfind("::");
		if (doubleColonPosition != string::npos)
		{
			auto prefixOptionName = internal::ConfigImpl::normalizeOptionName(
					optionName.substr(0, doubleColonPosition));
			// let's see is it defined
			if (__impl->regularVars.find(prefixOptionName) != __impl->regularVars.cend())
			{
				auto prefix = getPath(prefixOptionName);
				if (!prefix.empty() && *prefix.rbegin() != '/')
				{
					prefix += '/';
				}
				return prefix + shallowResult;
			}
		}
	}
	return shallowResult;
}

bool Config::getBool(const string& optionName) const
{
	auto result = getString(optionName);
	if (result.empty() || result == "false" || result == "0" || result == "no")
	{
		return false;
	}
	else
	{
		return true;
	}
}

ssize_t Config::getInteger(const string& optionName) const
{
	auto source = getString(optionName);
	if (source.empty())
	{
		return 0;
	}
	else
	{
		ssize_t result = 0;
		try
		{
			result = boost::lexical_cast< ssize_t >(source);
		}
		catch (boost::bad_lexical_cast&)
		{
			fatal2(__("unable to convert '%s' to a number"), source);
		}
		return result; // we'll never return default value here
	}
}

void Config::setScalar(const string& optionName, const string& value)
{
	auto normalizedOptionName = internal::ConfigImpl::normalizeOptionName(optionName);

	auto it = __impl->regularVars.find(normalizedOptionName);
	if (it != __impl->regularVars.end())
	{
		it->second = value;
	}
	else
	{
		warn2(__("an attempt to set the wrong scalar option '%s'"), optionName);
	}
}

} // namespace
