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
#include <pkgformula/versionstring.hpp>

#include <catch2/catch.hpp>

using namespace pkgformula;

TEST_CASE("Version ordering")
{
	CHECK(compareVersionStrings("1.0.0", "1.0.0") == 0);
	CHECK(compareVersionStrings("1.0.0", "1.0.1") == -1);
	CHECK(compareVersionStrings("2.0.0", "1.10.0") == 1);
	CHECK(compareVersionStrings("1.9", "1.10") == -1);
	CHECK(compareVersionStrings("1.01", "1.1") == 0);
	CHECK(compareVersionStrings("1.0", "1.0.0") == -1);
	CHECK(compareVersionStrings("1.0rc1", "1.0.0") == -1);
	CHECK(compareVersionStrings("1.0alpha", "1.0beta") == -1);
	CHECK(compareVersionStrings("1.10rc2", "1.10rc10") == -1);
}

TEST_CASE("Version ordering is total")
{
	vector< Version > versions;
	for (auto input: { "0.9", "1", "1.0", "1.0.0", "1.0alpha", "1.0rc1", "1.2", "1.10", "2.0.0", "10" })
	{
		versions.push_back(Version(input));
	}
	for (const auto& a: versions)
	{
		for (const auto& b: versions)
		{
			CHECK(a.compare(b) == -b.compare(a));
			CHECK(((a < b) + (a == b) + (a > b)) == 1);
			for (const auto& c: versions)
			{
				if (a <= b && b <= c)
				{
					CHECK(a <= c);
				}
			}
		}
	}
}

TEST_CASE("Version segments")
{
	Version version("1.10rc02");
	const auto& segments = version.getSegments();
	REQUIRE(segments.size() == 4);
	CHECK(segments[0].value == "1");
	CHECK(segments[1].value == "10");
	CHECK(segments[2].type == Version::Segment::Types::Text);
	CHECK(segments[2].value == "rc");
	CHECK(segments[3].type == Version::Segment::Types::Number);
	CHECK(segments[3].value == "2");
	CHECK(version.toString() == "1.10rc02");
}

TEST_CASE("Malformed versions are rejected")
{
	CHECK_THROWS_AS(Version(""), MalformedVersion);
	CHECK_THROWS_AS(Version("1..0"), MalformedVersion);
	CHECK_THROWS_AS(Version(".1"), MalformedVersion);
	CHECK_THROWS_AS(Version("1.0."), MalformedVersion);
	CHECK_THROWS_AS(Version("1.0 beta"), MalformedVersion);
	CHECK_THROWS_AS(Version("1\"0"), MalformedVersion);

	CHECK_FALSE(checkVersionString("1..0", false));
	CHECK(checkVersionString("0.9~beta+1", false));

	try
	{
		Version("1..0");
		FAIL("no exception");
	}
	catch (const MalformedVersion& e)
	{
		CHECK(e.getInput() == "1..0");
	}
}
