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
#include <cctype>

#include <algorithm>

#include <pkgformula/universe.hpp>

namespace pkgformula {

bool Universe::add(const string& packageName, const Version& version,
		const shared_ptr< const Formula >& formula)
{
	auto& entries = __entries[packageName];
	// keeping descending order
	auto position = std::find_if(entries.begin(), entries.end(),
			[&version](const Entry& entry) { return entry.version <= version; });
	if (position != entries.end() && position->version == version)
	{
		return false;
	}
	entries.insert(position, Entry{ version, formula });
	return true;
}

bool Universe::hasPackage(const string& packageName) const
{
	return __entries.count(packageName);
}

const vector< Universe::Entry >& Universe::getEntries(const string& packageName) const
{
	static const vector< Entry > empty;

	auto it = __entries.find(packageName);
	return (it != __entries.end()) ? it->second : empty;
}

auto Universe::getEntry(const string& packageName, const Version& version) const -> const Entry*
{
	for (const auto& entry: getEntries(packageName))
	{
		if (entry.version == version)
		{
			return &entry;
		}
	}
	return nullptr;
}

vector< string > Universe::getPackageNames() const
{
	vector< string > result;
	for (const auto& item: __entries)
	{
		result.push_back(item.first);
	}
	return result;
}

size_t Universe::getVersionCount() const
{
	size_t result = 0;
	for (const auto& item: __entries)
	{
		result += item.second.size();
	}
	return result;
}

namespace {

bool __is_blank(const string& input)
{
	return std::all_of(input.begin(), input.end(),
			[](char c) { return isspace((unsigned char)c); });
}

string __get_record_description(const PackageRecord& record)
{
	auto result = format2("%s %s", record.name, record.versionString);
	if (!record.origin.empty())
	{
		result += format2(" (%s)", record.origin);
	}
	return result;
}

}

Universe loadUniverse(const vector< PackageRecord >& records, vector< string >* errors)
{
	Universe result;

	auto reportError = [errors](const string& message)
	{
		warn2("%s", message);
		if (errors)
		{
			errors->push_back(message);
		}
	};

	for (const auto& record: records)
	{
		try
		{
			checkPackageName(record.name);
			Version version(record.versionString);

			shared_ptr< const Formula > formula;
			if (!__is_blank(record.formulaText))
			{
				formula = parseFormulaList(record.formulaText);
			}

			if (!result.add(record.name, version, formula))
			{
				reportError(format2(__("skipped the duplicate package version '%s'"),
						__get_record_description(record)));
			}
		}
		catch (Exception& e)
		{
			reportError(format2(__("skipped the package version '%s': %s"),
					__get_record_description(record), e.what()));
		}
	}

	return result;
}

}
