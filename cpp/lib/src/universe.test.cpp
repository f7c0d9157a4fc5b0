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
#include <pkgformula/universe.hpp>

#include <catch2/catch.hpp>

#include "testing.test.hpp"

using namespace pkgformula;
using testing::record;

TEST_CASE("Universe keeps versions newest first")
{
	Universe universe;
	CHECK(universe.add("A", Version("1.0"), nullptr));
	CHECK(universe.add("A", Version("2.0"), nullptr));
	CHECK(universe.add("A", Version("1.5"), parseFormula("\"B\"")));
	CHECK(universe.add("A", Version("1.5.0"), nullptr));
	CHECK_FALSE(universe.add("A", Version("2.0"), nullptr));

	const auto& entries = universe.getEntries("A");
	REQUIRE(entries.size() == 4);
	CHECK(entries[0].version.toString() == "2.0");
	CHECK(entries[1].version.toString() == "1.5.0");
	CHECK(entries[2].version.toString() == "1.5");
	CHECK(entries[3].version.toString() == "1.0");

	auto entry = universe.getEntry("A", Version("1.5"));
	REQUIRE(entry);
	REQUIRE(entry->formula);
	CHECK(entry->formula->toString() == "\"B\"");

	CHECK_FALSE(universe.getEntry("A", Version("3.0")));
	CHECK(universe.getEntries("Z").empty());
	CHECK_FALSE(universe.hasPackage("Z"));
}

TEST_CASE("Loading the sample universe")
{
	auto universe = testing::getSampleUniverse();
	CHECK(universe.getPackageNames() == vector< string >{ "A", "B", "C", "D", "E" });
	CHECK(universe.getVersionCount() == 14);
	CHECK(universe.getEntries("A").front().version.toString() == "3.0.0");
	CHECK_FALSE(universe.getEntry("C", Version("1.0.0"))->formula);
	CHECK(universe.getEntry("C", Version("1.5.0"))->formula);
}

TEST_CASE("Bad records are skipped")
{
	vector< string > errors;
	auto universe = loadUniverse({
			record("A", "1.0", "\"B\""),
			record("A", "1.0", "\"C\""),
			record("bad name", "1.0", ""),
			record("B", "1..0", ""),
			record("C", "1.0", "\"D\" &"),
			record("D", "1.0", "\"E\" {= \"x..y\"}"),
			record("E", "1.0", "   "),
		}, &errors);

	CHECK(errors.size() == 5);
	CHECK(universe.getPackageNames() == vector< string >{ "A", "E" });
	CHECK(universe.getEntry("A", Version("1.0"))->formula->toString() == "\"B\"");
	CHECK_FALSE(universe.getEntry("E", Version("1.0"))->formula);
}
