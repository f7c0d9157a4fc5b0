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

#include <catch2/catch.hpp>

using namespace pkgformula;

namespace {

typedef Constraint::Comparators Comparators;

bool holds(Comparators::Type comparator, const char* bound, const char* candidate)
{
	return Constraint(comparator, Version(bound)).holds(Version(candidate));
}

bool expectedByOrder(Comparators::Type comparator, int order)
{
	switch (comparator)
	{
		case Comparators::Equal: return order == 0;
		case Comparators::NotEqual: return order != 0;
		case Comparators::Less: return order < 0;
		case Comparators::LessOrEqual: return order <= 0;
		case Comparators::More: return order > 0;
		case Comparators::MoreOrEqual: return order >= 0;
	}
	FAIL("unknown comparator " << int(comparator));
	return false;
}

const vector< string > versionSample = { "0.9", "1", "1.0", "1.0.0", "1.0alpha", "1.0rc1",
		"1.01", "1.2", "1.10", "2.0.0", "10" };

}

TEST_CASE("Comparators")
{
	CHECK(holds(Comparators::Equal, "1.0.0", "1.0.0"));
	CHECK_FALSE(holds(Comparators::Equal, "1.0.0", "1.0"));
	CHECK(holds(Comparators::NotEqual, "1.1.0", "1.0.0"));
	CHECK(holds(Comparators::Less, "1.4.0", "1.0.0"));
	CHECK_FALSE(holds(Comparators::Less, "1.4.0", "1.4.0"));
	CHECK(holds(Comparators::LessOrEqual, "1.4.0", "1.4.0"));
	CHECK(holds(Comparators::More, "1.0.0", "1.2.0"));
	CHECK_FALSE(holds(Comparators::More, "1.0.0", "1.0.0"));
	CHECK(holds(Comparators::MoreOrEqual, "2.0.0", "2.0.0"));
}

TEST_CASE("Comparators agree with the version order")
{
	for (auto comparator: { Comparators::Equal, Comparators::NotEqual, Comparators::Less,
			Comparators::LessOrEqual, Comparators::More, Comparators::MoreOrEqual })
	{
		for (const auto& bound: versionSample)
		{
			Constraint constraint(comparator, Version(bound));
			for (const auto& candidate: versionSample)
			{
				Version candidateVersion(candidate);
				INFO(candidate << ' ' << Comparators::strings[comparator] << ' ' << bound);
				CHECK(constraint.holds(candidateVersion) ==
						expectedByOrder(comparator, candidateVersion.compare(Version(bound))));
			}
		}
	}
}

TEST_CASE("Comparator parsing and negation")
{
	Comparators::Type type = Comparators::Equal;
	CHECK(Comparators::parse(">=", type));
	CHECK(type == Comparators::MoreOrEqual);
	CHECK_FALSE(Comparators::parse("=>", type));
	CHECK(type == Comparators::MoreOrEqual);

	for (auto comparator: { Comparators::Equal, Comparators::NotEqual, Comparators::Less,
			Comparators::LessOrEqual, Comparators::More, Comparators::MoreOrEqual })
	{
		auto negated = Comparators::negate(comparator);
		CHECK(Comparators::negate(negated) == comparator);
		for (auto candidate: { "2.4.0", "2.5.0", "2.6.0" })
		{
			CHECK(holds(comparator, "2.5.0", candidate) != holds(negated, "2.5.0", candidate));
		}
	}
}

TEST_CASE("Constraint sets are conjunctions")
{
	vector< Constraint > constraints = {
		Constraint(Comparators::MoreOrEqual, Version("1.0.0")),
		Constraint(Comparators::Less, Version("2.0.0")),
	};
	CHECK(satisfiesAll(constraints, Version("1.5.0")));
	CHECK_FALSE(satisfiesAll(constraints, Version("2.0.0")));
	CHECK(satisfiesAll({}, Version("0.1")));
	CHECK(constraintsToString(constraints) == ">= \"1.0.0\" & < \"2.0.0\"");
}
