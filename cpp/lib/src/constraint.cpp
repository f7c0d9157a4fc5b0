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
#include <pkgformula/constraint.hpp>

namespace pkgformula {

const string Constraint::Comparators::strings[] = { "=", "!=", "<", "<=", ">", ">=" };

auto Constraint::Comparators::negate(Type type) -> Type
{
	switch (type)
	{
		case Equal: return NotEqual;
		case NotEqual: return Equal;
		case Less: return MoreOrEqual;
		case LessOrEqual: return More;
		case More: return LessOrEqual;
		case MoreOrEqual: return Less;
	}
	fatal2i("constraint: unknown comparator %d", int(type));
	__builtin_unreachable();
}

bool Constraint::Comparators::parse(const string& input, Type& type)
{
	for (size_t i = 0; i <= size_t(MoreOrEqual); ++i)
	{
		if (strings[i] == input)
		{
			type = Type(i);
			return true;
		}
	}
	return false;
}

bool Constraint::holds(const Version& candidate) const
{
	auto comparisonResult = candidate.compare(version);
	switch (comparator)
	{
		case Comparators::Equal:
			return (comparisonResult == 0);
		case Comparators::NotEqual:
			return (comparisonResult != 0);
		case Comparators::Less:
			return (comparisonResult < 0);
		case Comparators::LessOrEqual:
			return (comparisonResult <= 0);
		case Comparators::More:
			return (comparisonResult > 0);
		case Comparators::MoreOrEqual:
			return (comparisonResult >= 0);
	}
	__builtin_unreachable();
}

string Constraint::toString() const
{
	return Comparators::strings[comparator] + " \"" + version.toString() + '"';
}

bool Constraint::operator==(const Constraint& other) const
{
	return comparator == other.comparator && version == other.version;
}

bool satisfiesAll(const vector< Constraint >& constraints, const Version& candidate)
{
	for (const auto& constraint: constraints)
	{
		if (!constraint.holds(candidate))
		{
			return false;
		}
	}
	return true;
}

string constraintsToString(const vector< Constraint >& constraints)
{
	vector< string > parts;
	for (const auto& constraint: constraints)
	{
		parts.push_back(constraint.toString());
	}
	return join(" & ", parts);
}

}

