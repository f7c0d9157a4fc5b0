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
#include <pkgformula/formula.hpp>
#include <pkgformula/selection.hpp>

#include <catch2/catch.hpp>

#include "testing.test.hpp"

using namespace pkgformula;

namespace {

size_t getErrorPosition(const string& input)
{
	try
	{
		parseFormula(input);
	}
	catch (const SyntaxError& e)
	{
		return e.getPosition();
	}
	FAIL("no syntax error in '" << input << "'");
	return string::npos;
}

}

TEST_CASE("Formula structure")
{
	auto formula = parseFormula("\"B\" {> \"1.2.0\"} & ( \"C\" | ( \"D\" {= \"2.0.0\" & ! (< \"2.5.0\")} ) )");
	REQUIRE(formula->type == Formula::Types::And);
	CHECK(formula->left->type == Formula::Types::Package);
	CHECK(formula->left->packageName == "B");
	const auto& disjunction = formula->right;
	REQUIRE(disjunction->type == Formula::Types::Or);
	const auto& d = disjunction->right;
	REQUIRE(d->type == Formula::Types::Package);
	REQUIRE(d->constraints.size() == 2);
	CHECK(d->constraints[0].comparator == Constraint::Comparators::Equal);
	// the negated constraint becomes the inverse comparator
	CHECK(d->constraints[1].comparator == Constraint::Comparators::MoreOrEqual);
	CHECK(d->constraints[1].version.toString() == "2.5.0");

	CHECK(formula->getPackageNames() == vector< string >{ "B", "C", "D" });
	CHECK_FALSE(formula->containsNegation());
}

TEST_CASE("Operator precedence")
{
	auto formula = parseFormula("\"A\" | \"B\" & \"C\"");
	REQUIRE(formula->type == Formula::Types::Or);
	CHECK(formula->right->type == Formula::Types::And);

	auto chain = parseFormula("\"A\" & \"B\" & \"C\"");
	REQUIRE(chain->type == Formula::Types::And);
	CHECK(chain->left->type == Formula::Types::And);

	auto negation = parseFormula("!\"A\" & \"B\"");
	REQUIRE(negation->type == Formula::Types::And);
	CHECK(negation->left->type == Formula::Types::Not);
	CHECK(negation->containsNegation());
}

TEST_CASE("Canonical form")
{
	CHECK(parseFormula("(\"B\" {> \"1.0.0\"} & \"C\" {< \"1.4.0\"})")->toString() ==
			"\"B\" {> \"1.0.0\"} & \"C\" {< \"1.4.0\"}");
	CHECK(parseFormula("\"B\" {> \"1.2.0\"} & ( \"C\" | ( \"D\" {= \"2.0.0\" & ! (< \"2.5.0\")} ) )")->toString() ==
			"\"B\" {> \"1.2.0\"} & (\"C\" | \"D\" {= \"2.0.0\" & >= \"2.5.0\"})");
	CHECK(parseFormula("(\"A\" | \"B\") & \"C\"")->toString() == "(\"A\" | \"B\") & \"C\"");
	CHECK(parseFormula("\"A\" | (\"B\" | \"C\")")->toString() == "\"A\" | (\"B\" | \"C\")");
	CHECK(parseFormula("!(\"A\" & \"B\")")->toString() == "!(\"A\" & \"B\")");
	CHECK(parseFormula("  \"A\"  ")->toString() == "\"A\"");
}

TEST_CASE("Canonical form parses back to the same formula")
{
	for (const auto& record: testing::getSampleRecords())
	{
		auto formula = parseFormulaList(record.formulaText);
		if (!formula)
		{
			continue;
		}
		INFO(record.formulaText);
		auto reparsed = parseFormula(formula->toString());
		CHECK(*reparsed == *formula);
		CHECK(reparsed->toString() == formula->toString());
	}
}

TEST_CASE("Formula lists")
{
	CHECK_FALSE(parseFormulaList(""));
	CHECK_FALSE(parseFormulaList("  \n "));
	auto formula = parseFormulaList("\"A\" \"B\" {>= \"1\"}\n\"C\"");
	REQUIRE(formula);
	CHECK(formula->toString() == "\"A\" & \"B\" {>= \"1\"} & \"C\"");
}

TEST_CASE("Syntax errors")
{
	CHECK(getErrorPosition("") == 0);
	CHECK(getErrorPosition("\"A\" &") == 5);
	CHECK(getErrorPosition("\"A\" \"B\"") == 4);
	CHECK(getErrorPosition("\"A") == 2);
	CHECK(getErrorPosition("\"A\" {>> \"1\"}") == 5);
	CHECK(getErrorPosition("\"A\" {\"1\"}") == 5);
	CHECK(getErrorPosition("(\"A\"") == 4);
	CHECK(getErrorPosition("\"A\" {= \"1\"") == 10);
	CHECK(getErrorPosition("\"a b\"") == 0);

	try
	{
		parseFormula("\"A\" &");
		FAIL("no exception");
	}
	catch (const SyntaxError& e)
	{
		const auto& expected = e.getExpected();
		REQUIRE(!expected.empty());
		CHECK(string(e.what()).find("position 5") != string::npos);
	}

	// a malformed version is reported at its opening quote
	CHECK(getErrorPosition("\"A\" {= \"1..0\"}") == 7);
	CHECK(getErrorPosition("\"A\" {>= \"1.0\" & < \"2.0 beta\"}") == 18);
	CHECK(getErrorPosition("\"A\" | \"B\" {!(= \"\")}") == 15);
}

TEST_CASE("Nesting depth is bounded")
{
	string deepest = string(512, '(') + "\"A\"" + string(512, ')');
	CHECK(parseFormula(deepest)->toString() == "\"A\"");
	CHECK(getErrorPosition(string(513, '(') + "\"A\"" + string(513, ')')) == 512);
	CHECK(getErrorPosition(string(600, '!') + "\"A\"") == 512);
	CHECK(getErrorPosition("\"A\" {" + string(513, '!') + " = \"1\"}") == 517);
}

TEST_CASE("Long chains")
{
	const size_t termCount = 100000;
	auto makeChainText = [termCount](const char* connective)
	{
		string result = "\"A\"";
		for (size_t i = 1; i < termCount; ++i)
		{
			result += connective;
			result += "\"A\"";
		}
		return result;
	};
	Selection selection;
	selection.set("A", Version("1.0"));

	SECTION("conjunction")
	{
		auto text = makeChainText(" & ");
		auto formula = parseFormula(text);
		CHECK(formula->isSatisfiedBy(selection));
		CHECK_FALSE(formula->isSatisfiedBy(Selection()));
		CHECK(formula->isSatisfiedBy("A", Version("2")));
		CHECK_FALSE(formula->isSatisfiedBy("B", Version("2")));
		CHECK_FALSE(formula->containsNegation());
		CHECK(formula->getPackageNames() == vector< string >{ "A" });
		CHECK(formula->toString() == text);
		CHECK(*parseFormula(text) == *formula);
	}
	SECTION("disjunction")
	{
		auto text = makeChainText(" | ");
		auto formula = parseFormula(text);
		CHECK(formula->isSatisfiedBy(selection));
		CHECK_FALSE(formula->isSatisfiedBy(Selection()));
		CHECK(formula->toString() == text);
		CHECK(*parseFormula(text) == *formula);
		CHECK(*formula != *parseFormula(makeChainText(" & ")));
	}
	SECTION("right-nested and negated")
	{
		auto formula = Formula::makePackage("A");
		for (size_t i = 1; i < termCount; ++i)
		{
			formula = Formula::makeAnd(Formula::makePackage("B"), formula);
		}
		CHECK(formula->getPackageNames() == vector< string >{ "B", "A" });
		selection.set("B", Version("1.0"));
		CHECK(formula->isSatisfiedBy(selection));

		auto negated = formula;
		for (size_t i = 0; i < termCount; ++i)
		{
			negated = Formula::makeNot(negated);
		}
		// an even number of negations
		CHECK(negated->isSatisfiedBy(selection));
		CHECK(negated->containsNegation());
		CHECK(negated->toString().size() == formula->toString().size() + termCount + 2);
	}
	// every section releases its chain here
}

TEST_CASE("Formula evaluation")
{
	auto formula = parseFormula("\"A\" {>= \"1.0\"} & (\"B\" | !\"C\")");

	Selection selection;
	CHECK_FALSE(formula->isSatisfiedBy(selection));
	selection.set("A", Version("1.5"));
	CHECK(formula->isSatisfiedBy(selection));
	selection.set("C", Version("1.0"));
	CHECK_FALSE(formula->isSatisfiedBy(selection));
	selection.set("B", Version("0.1"));
	CHECK(formula->isSatisfiedBy(selection));
	selection.set("A", Version("0.9"));
	CHECK_FALSE(formula->isSatisfiedBy(selection));

	auto single = parseFormula("\"A\" {< \"2.0\"} | \"B\"");
	CHECK(single->isSatisfiedBy("A", Version("1.0")));
	CHECK_FALSE(single->isSatisfiedBy("A", Version("2.0")));
	CHECK(single->isSatisfiedBy("B", Version("9")));
	CHECK_FALSE(single->isSatisfiedBy("C", Version("1.0")));
}

TEST_CASE("Package names")
{
	CHECK(checkPackageName("lib-foo_2.0+x", false));
	CHECK_FALSE(checkPackageName("", false));
	CHECK_FALSE(checkPackageName("a b", false));
	CHECK_THROWS_AS(checkPackageName("a{b"), Exception);
}

TEST_CASE("Negated constraint inside a conjunction")
{
	auto formula = parseFormula("\"X\" {>= \"1.0.0\" & ! (< \"2.5.0\")}");
	CHECK_FALSE(formula->isSatisfiedBy("X", Version("2.0.0")));
	CHECK(formula->isSatisfiedBy("X", Version("2.5.0")));
	CHECK(formula->isSatisfiedBy("X", Version("3.0")));
	CHECK_FALSE(formula->isSatisfiedBy("X", Version("0.9")));
}
