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
#include <cstring>

#include <pkgformula/versionstring.hpp>

namespace pkgformula {

MalformedVersion::MalformedVersion(const string& input, const string& reason)
	: Exception(format2(__("invalid version string '%s': %s"), input, reason)), __input(input)
{}

namespace {

typedef string::const_iterator Anchor;

inline bool __check_version_symbol(char symbol)
{
	if (!isgraph((unsigned char)symbol))
	{
		return false;
	}
	return !strchr("\"{}()&|!<>=", symbol);
}

// returns an empty string if the version is good
string __get_version_string_problem(const string& input)
{
	if (input.empty())
	{
		return __("empty version string");
	}
	bool pieceIsEmpty = true;
	for (char symbol: input)
	{
		if (symbol == '.')
		{
			if (pieceIsEmpty)
			{
				return __("empty dot-separated part");
			}
			pieceIsEmpty = true;
		}
		else if (!__check_version_symbol(symbol))
		{
			return format2(__("forbidden character '%c'"), symbol);
		}
		else
		{
			pieceIsEmpty = false;
		}
	}
	if (pieceIsEmpty)
	{
		return __("empty dot-separated part");
	}
	return string();
}

void __consume_number(Anchor& substringStart, Anchor& substringEnd, const Anchor& end)
{
	// skipping leading zeroes, but the last zero of "000" stays
	while (substringStart != end && *substringStart == '0' &&
			(substringStart + 1) != end && isdigit(*(substringStart + 1)))
	{
		++substringStart;
	}
	substringEnd = substringStart;
	while (substringEnd != end && isdigit(*substringEnd))
	{
		++substringEnd;
	}
}

void __consume_text(const Anchor& substringStart, Anchor& substringEnd, const Anchor& end)
{
	substringEnd = substringStart;
	while (substringEnd != end && *substringEnd != '.' && !isdigit(*substringEnd))
	{
		++substringEnd;
	}
}

vector< Version::Segment > __split_to_segments(const string& input)
{
	typedef Version::Segment::Types SegmentTypes;

	vector< Version::Segment > result;
	auto current = input.begin();
	const auto end = input.end();
	while (current != end)
	{
		if (*current == '.')
		{
			++current;
			continue;
		}

		Version::Segment segment;
		Anchor segmentStart = current;
		Anchor segmentEnd;
		if (isdigit(*current))
		{
			segment.type = SegmentTypes::Number;
			__consume_number(segmentStart, segmentEnd, end);
		}
		else
		{
			segment.type = SegmentTypes::Text;
			__consume_text(segmentStart, segmentEnd, end);
		}
		segment.value.assign(segmentStart, segmentEnd);
		result.push_back(std::move(segment));
		current = segmentEnd;
	}
	return result;
}

int __compare_segments(const Version::Segment& left, const Version::Segment& right)
{
	typedef Version::Segment::Types SegmentTypes;

	if (left.type != right.type)
	{
		// numbers are greater than text at the same position
		return (left.type == SegmentTypes::Number) ? 1 : -1;
	}
	if (left.type == SegmentTypes::Number)
	{
		// no leading zeroes here, so the longer number is the bigger one
		if (left.value.size() != right.value.size())
		{
			return (left.value.size() < right.value.size()) ? -1 : 1;
		}
	}
	auto compareResult = left.value.compare(right.value);
	if (compareResult != 0)
	{
		return (compareResult < 0) ? -1 : 1;
	}
	return 0;
}

}

bool Version::Segment::operator==(const Segment& other) const
{
	return type == other.type && value == other.value;
}

Version::Version(const string& input)
	: __original(input)
{
	auto problem = __get_version_string_problem(input);
	if (!problem.empty())
	{
		fatal2x(MalformedVersion(input, problem));
	}
	__segments = __split_to_segments(input);
}

int Version::compare(const Version& other) const
{
	const auto& leftSegments = __segments;
	const auto& rightSegments = other.__segments;

	auto leftIt = leftSegments.begin();
	auto rightIt = rightSegments.begin();
	for (; leftIt != leftSegments.end() && rightIt != rightSegments.end(); ++leftIt, ++rightIt)
	{
		auto compareResult = __compare_segments(*leftIt, *rightIt);
		if (compareResult != 0)
		{
			return compareResult;
		}
	}

	// the missing segment is the minimal one
	if (leftIt != leftSegments.end())
	{
		return 1;
	}
	if (rightIt != rightSegments.end())
	{
		return -1;
	}
	return 0;
}

bool checkVersionString(const string& versionString, bool throwOnError)
{
	auto problem = __get_version_string_problem(versionString);
	if (!problem.empty() && throwOnError)
	{
		fatal2x(MalformedVersion(versionString, problem));
	}
	return problem.empty();
}

int compareVersionStrings(const string& left, const string& right)
{
	return Version(left).compare(Version(right));
}

}

