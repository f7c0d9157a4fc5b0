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
#include <pkgformula/resolver.hpp>

#include <catch2/catch.hpp>

#include "testing.test.hpp"

using namespace pkgformula;
using testing::record;

namespace {

typedef Resolver::Outcome Outcome;
typedef Conflict::Reasons Reasons;

Selection makeSelection(const vector< pair< string, string > >& items)
{
	Selection result;
	for (const auto& item: items)
	{
		result.set(item.first, Version(item.second));
	}
	return result;
}

vector< Constraint > exactly(const char* version)
{
	return { Constraint(Constraint::Comparators::Equal, Version(version)) };
}

}

TEST_CASE("Resolving the sample universe")
{
	auto universe = testing::getSampleUniverse();

	SECTION("newest root version")
	{
		auto result = resolve(universe, "A");
		REQUIRE(result.isSolved());
		// the first branch of B 2.0.0 needs A < 3.0.0, C is restricted by A
		CHECK(result.selection == makeSelection({
				{ "A", "3.0.0" }, { "B", "2.0.0" }, { "C", "1.5.0" }, { "E", "1.0.0" } }));
	}
	SECTION("constrained root")
	{
		auto result = resolve(universe, "A", exactly("1.0.0"));
		REQUIRE(result.isSolved());
		CHECK(result.selection == makeSelection({
				{ "A", "1.0.0" }, { "B", "2.0.0" }, { "C", "1.0.0" }, { "E", "1.0.0" } }));
	}
	SECTION("right branch after a failed left one")
	{
		auto result = resolve(universe, "A", exactly("1.2.0"));
		REQUIRE(result.isSolved());
		CHECK(result.selection == makeSelection({ { "A", "1.2.0" }, { "C", "1.0.0" } }));
		CHECK(result.backtrackCount > 0);
	}
	SECTION("nested disjunction")
	{
		auto result = resolve(universe, "A", exactly("2.0.0"));
		REQUIRE(result.isSolved());
		CHECK(result.selection == makeSelection({
				{ "A", "2.0.0" }, { "B", "2.0.0" }, { "C", "1.5.0" }, { "E", "1.0.0" } }));
	}
	SECTION("the result is deterministic")
	{
		auto first = resolve(universe, "A");
		auto second = resolve(universe, "A");
		CHECK(first.selection == second.selection);
		CHECK(first.stepCount == second.stepCount);
	}
}

TEST_CASE("Solutions satisfy every selected formula")
{
	auto universe = testing::getSampleUniverse();
	for (const auto& entry: universe.getEntries("A"))
	{
		auto result = resolve(universe, "A", exactly(entry.version.toString().c_str()));
		if (!result.isSolved())
		{
			continue;
		}
		INFO("A " << entry.version.toString());
		for (const auto& item: result.selection)
		{
			auto selectedEntry = universe.getEntry(item.first, item.second);
			REQUIRE(selectedEntry);
			if (selectedEntry->formula)
			{
				CHECK(selectedEntry->formula->isSatisfiedBy(result.selection));
			}
		}
	}
}

TEST_CASE("Unsatisfiable requests")
{
	SECTION("no candidate")
	{
		auto universe = testing::makeUniverse({
				record("A", "1.0.0", "(\"B\" {> \"1.0.0\"} & \"C\" {< \"1.4.0\"})"),
				record("B", "1.0.0", "\"E\" {= \"1.0.0\"}"),
				record("E", "1.0.0", ""),
			});
		auto result = resolve(universe, "A", exactly("1.0.0"));
		REQUIRE(result.outcome == Outcome::Exhausted);
		const auto& conflict = result.conflict;
		CHECK(conflict.reason == Reasons::NoCandidate);
		CHECK(conflict.packageName == "B");
		CHECK(conflict.requiredByName == "A");
		CHECK(conflict.requiredByVersion == "1.0.0");
		CHECK(conflict.partialSelection == makeSelection({ { "A", "1.0.0" } }));
		CHECK(conflict.toString().find("'B'") != string::npos);
	}
	SECTION("unknown dependency")
	{
		auto universe = testing::makeUniverse({ record("A", "1.0", "\"Z\"") });
		auto result = resolve(universe, "A");
		REQUIRE(result.outcome == Outcome::Exhausted);
		CHECK(result.conflict.reason == Reasons::UnknownPackage);
		CHECK(result.conflict.packageName == "Z");
		CHECK(result.conflict.requiredByName == "A");
	}
	SECTION("unknown root")
	{
		auto universe = testing::getSampleUniverse();
		auto result = resolve(universe, "Q");
		REQUIRE(result.outcome == Outcome::Exhausted);
		CHECK(result.conflict.reason == Reasons::UnknownPackage);
		CHECK(result.conflict.requiredByName.empty());
	}
	SECTION("no version of the root")
	{
		auto universe = testing::getSampleUniverse();
		auto result = resolve(universe, "A", exactly("9.0"));
		REQUIRE(result.outcome == Outcome::Exhausted);
		CHECK(result.conflict.reason == Reasons::NoCandidate);
	}
	SECTION("dependency chain in the conflict")
	{
		auto universe = testing::makeUniverse({
				record("A", "1", "\"B\""),
				record("B", "1", "\"C\" {>= \"2\"}"),
				record("C", "1", ""),
			});
		auto result = resolve(universe, "A");
		REQUIRE(result.outcome == Outcome::Exhausted);
		CHECK(result.conflict.path == vector< string >{ "A", "B" });
		CHECK(result.conflict.toString().find("A -> B") != string::npos);
	}
	SECTION("invalid root name")
	{
		auto universe = testing::getSampleUniverse();
		CHECK_THROWS_AS(resolve(universe, "a b"), Exception);
	}
}

TEST_CASE("Cyclic dependencies")
{
	auto universe = testing::makeUniverse({
			record("A", "1.0", "\"B\""),
			record("B", "1.0", "\"A\" {= \"1.0\"}"),
		});
	auto result = resolve(universe, "A");
	REQUIRE(result.isSolved());
	CHECK(result.selection == makeSelection({ { "A", "1.0" }, { "B", "1.0" } }));
}

TEST_CASE("Negated dependencies")
{
	SECTION("absent package")
	{
		auto universe = testing::makeUniverse({
				record("X", "1", "!\"Y\""),
				record("Y", "1", ""),
			});
		auto result = resolve(universe, "X");
		REQUIRE(result.isSolved());
		CHECK(result.selection == makeSelection({ { "X", "1" } }));
	}
	SECTION("negation checked after a selection")
	{
		auto universe = testing::makeUniverse({
				record("X", "1", "\"Z\" & !\"Y\""),
				record("Y", "1", ""),
				record("Z", "1", "\"Y\""),
			});
		auto result = resolve(universe, "X");
		REQUIRE(result.outcome == Outcome::Exhausted);
		CHECK(result.conflict.reason == Reasons::NegationViolated);
	}
	SECTION("negation checked before a selection")
	{
		auto universe = testing::makeUniverse({
				record("P", "1", "!\"R\" & \"Q\""),
				record("Q", "2", "\"R\""),
				record("Q", "1", ""),
				record("R", "1", ""),
			});
		auto result = resolve(universe, "P");
		REQUIRE(result.isSolved());
		CHECK(result.selection == makeSelection({ { "P", "1" }, { "Q", "1" } }));
		CHECK(result.backtrackCount > 0);
	}
	SECTION("negated version range")
	{
		auto universe = testing::makeUniverse({
				record("P", "1", "\"Q\" & !\"Q\" {>= \"2\"}"),
				record("Q", "2", ""),
				record("Q", "1", ""),
			});
		auto result = resolve(universe, "P");
		REQUIRE(result.isSolved());
		CHECK(result.selection == makeSelection({ { "P", "1" }, { "Q", "1" } }));
	}
}

TEST_CASE("Resolver limits")
{
	auto universe = testing::getSampleUniverse();
	Config config;

	SECTION("step limit")
	{
		config.setScalar("pkgformula::resolver::max-steps", "3");
		auto result = Resolver(config).resolve(universe, "A", {});
		REQUIRE(result.outcome == Outcome::Exhausted);
		CHECK(result.conflict.reason == Reasons::StepLimit);
		CHECK(result.stepCount == 3);
	}
	SECTION("zero means no limit")
	{
		config.setScalar("pkgformula::resolver::max-steps", "0");
		CHECK(Resolver(config).resolve(universe, "A", {}).isSolved());
	}
	SECTION("negative limit")
	{
		config.setScalar("pkgformula::resolver::max-steps", "-1");
		CHECK_THROWS_AS(Resolver(config).resolve(universe, "A", {}), Exception);
	}
	SECTION("immediate cancellation")
	{
		auto result = Resolver(config).resolve(universe, "A", {}, []() { return true; });
		CHECK(result.outcome == Outcome::Cancelled);
	}
	SECTION("cancellation during the search")
	{
		size_t checkCount = 0;
		auto result = Resolver(config).resolve(universe, "A", {},
				[&checkCount]() { return ++checkCount > 2; });
		CHECK(result.outcome == Outcome::Cancelled);
		CHECK(checkCount == 3);
	}
	SECTION("debugging output does not change the result")
	{
		config.setScalar("debug::resolver", "yes");
		auto result = Resolver(config).resolve(universe, "A", {});
		REQUIRE(result.isSolved());
		CHECK(result.selection == resolve(universe, "A").selection);
	}
}

TEST_CASE("Resolving a long conjunction")
{
	string chain = "\"A\"";
	for (size_t i = 1; i < 100000; ++i)
	{
		chain += " & \"A\"";
	}
	auto universe = testing::makeUniverse({
			record("R", "1", chain),
			record("A", "1", ""),
			record("A", "2", "\"B\"") });
	Config config;
	config.setScalar("pkgformula::resolver::max-steps", "0");

	auto result = Resolver(config).resolve(universe, "R", {});
	REQUIRE(result.isSolved());
	CHECK(result.selection == makeSelection({ { "R", "1" }, { "A", "1" } }));
	CHECK(getDependencyGraph(universe, result.selection)["R"] == vector< string >{ "A" });
}
