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
#include <common/regex.hpp>

#include <pkgformula/file.hpp>
#include <pkgformula/repository.hpp>

#include <internal/filesystem.hpp>

namespace pkgformula {

namespace {

string __get_string_field(const string& text, const char* fieldName)
{
	auto regex = sregex::compile(string("^[ \\t]*") + fieldName + "[ \\t]*:[ \\t]*\"([^\"]*)\"");
	smatch m;
	if (regex_search(text, m, regex))
	{
		return m[1].str();
	}
	return string();
}

// returns the text between the brackets of 'depends: [ ... ]', without comments
string __get_depends_body(const string& text, const string& path)
{
	static const sregex startRegex = sregex::compile("^[ \\t]*depends[ \\t]*:[ \\t\\n]*\\[");
	smatch m;
	if (!regex_search(text, m, startRegex))
	{
		return string();
	}

	string result;
	size_t depth = 1;
	bool insideQuotes = false;
	for (auto it = m[0].second; it != text.end(); ++it)
	{
		char c = *it;
		if (insideQuotes)
		{
			if (c == '"')
			{
				insideQuotes = false;
			}
		}
		else if (c == '"')
		{
			insideQuotes = true;
		}
		else if (c == '#')
		{
			// comment till the end of line
			while (it + 1 != text.end() && *(it + 1) != '\n')
			{
				++it;
			}
			continue;
		}
		else if (c == '[')
		{
			++depth;
		}
		else if (c == ']')
		{
			if (--depth == 0)
			{
				return result;
			}
		}
		result += c;
	}
	fatal2(__("unterminated 'depends' list in '%s'"), path);
	return string(); // unreachable
}

}

PackageRecord parseOpamFile(const string& text, const string& path)
{
	PackageRecord result;
	result.origin = path;
	result.name = __get_string_field(text, "name");
	result.versionString = __get_string_field(text, "version");
	result.formulaText = __get_depends_body(text, path);

	if (result.name.empty() || result.versionString.empty())
	{
		// <name>.<version>/opam
		auto directoryName = internal::fs::filename(internal::fs::dirname(path));
		if (result.name.empty())
		{
			result.name = directoryName.substr(0, directoryName.find('.'));
		}
		if (result.versionString.empty())
		{
			auto prefix = result.name + '.';
			if (directoryName.compare(0, prefix.size(), prefix) == 0)
			{
				result.versionString = directoryName.substr(prefix.size());
			}
		}
	}
	if (result.name.empty())
	{
		fatal2(__("unable to determine the package name of '%s'"), path);
	}
	if (result.versionString.empty())
	{
		fatal2(__("unable to determine the package version of '%s'"), path);
	}

	return result;
}

vector< PackageRecord > readRepository(const string& directory)
{
	if (!internal::fs::dirExists(directory))
	{
		fatal2(__("the repository directory '%s' does not exist"), directory);
	}
	auto packagesDirectory = directory + "/packages";
	if (!internal::fs::dirExists(packagesDirectory))
	{
		packagesDirectory = directory;
	}

	vector< PackageRecord > result;
	for (const auto& path: internal::fs::glob(packagesDirectory + "/*/*/opam"))
	{
		try
		{
			string text;
			RequiredFile(path, "r").getFile(text);
			result.push_back(parseOpamFile(text, path));
		}
		catch (Exception&)
		{
			warn2(__("skipped the package file '%s'"), path);
		}
	}
	return result;
}

}
