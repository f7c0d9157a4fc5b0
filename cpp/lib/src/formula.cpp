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
#include <set>

#include <common/regex.hpp>

#include <pkgformula/formula.hpp>
#include <pkgformula/selection.hpp>

#include <internal/formulaparser.hpp>

namespace pkgformula {

Formula::Formula(Types::Type type_, const string& packageName_,
		const vector< Constraint >& constraints_,
		const shared_ptr< const Formula >& left_, const shared_ptr< const Formula >& right_)
	: type(type_), packageName(packageName_), constraints(constraints_),
	left(left_), right(right_)
{}

shared_ptr< const Formula > Formula::makePackage(const string& packageName,
		const vector< Constraint >& constraints)
{
	if (packageName.empty())
	{
		fatal2i("formula: empty package name");
	}
	return shared_ptr< const Formula >(new Formula(Types::Package, packageName, constraints,
			shared_ptr< const Formula >(), shared_ptr< const Formula >()));
}

shared_ptr< const Formula > Formula::makeAnd(const shared_ptr< const Formula >& left,
		const shared_ptr< const Formula >& right)
{
	if (!left || !right)
	{
		fatal2i("formula: missing operand of a conjunction");
	}
	return shared_ptr< const Formula >(new Formula(Types::And, string(),
			vector< Constraint >(), left, right));
}

shared_ptr< const Formula > Formula::makeOr(const shared_ptr< const Formula >& left,
		const shared_ptr< const Formula >& right)
{
	if (!left || !right)
	{
		fatal2i("formula: missing operand of a disjunction");
	}
	return shared_ptr< const Formula >(new Formula(Types::Or, string(),
			vector< Constraint >(), left, right));
}

shared_ptr< const Formula > Formula::makeNot(const shared_ptr< const Formula >& inner)
{
	if (!inner)
	{
		fatal2i("formula: missing operand of a negation");
	}
	return shared_ptr< const Formula >(new Formula(Types::Not, string(),
			vector< Constraint >(), inner, shared_ptr< const Formula >()));
}

Formula::~Formula()
{
	// a chain of thousands of nodes must not be released recursively
	vector< shared_ptr< const Formula > > orphans;
	auto adopt = [&orphans](shared_ptr< const Formula >& child)
	{
		if (child.use_count() == 1)
		{
			orphans.push_back(std::move(child));
		}
	};
	adopt(left);
	adopt(right);
	while (!orphans.empty())
	{
		auto orphan = std::move(orphans.back());
		orphans.pop_back();
		// the last owner, and nodes are never created const
		auto node = const_cast< Formula* >(orphan.get());
		adopt(node->left);
		adopt(node->right);
	}
}

namespace {

bool __is_binary(const Formula& formula)
{
	return formula.type == Formula::Types::And || formula.type == Formula::Types::Or;
}

template < typename LeafPredicate >
bool __evaluate(const Formula& root, const LeafPredicate& isLeafSatisfied)
{
	struct Frame
	{
		const Formula* formula;
		size_t visitedOperandCount;
	};
	vector< Frame > frames = { { &root, 0 } };
	bool value = false; // of the last finished node

	while (!frames.empty())
	{
		Frame& frame = frames.back();
		const Formula& formula = *frame.formula;
		switch (formula.type)
		{
			case Formula::Types::Package:
				value = isLeafSatisfied(formula);
				frames.pop_back();
				break;
			case Formula::Types::Not:
				if (frame.visitedOperandCount == 0)
				{
					frame.visitedOperandCount = 1;
					frames.push_back({ formula.left.get(), 0 });
				}
				else
				{
					value = !value;
					frames.pop_back();
				}
				break;
			case Formula::Types::And:
			case Formula::Types::Or:
				if (frame.visitedOperandCount == 0)
				{
					frame.visitedOperandCount = 1;
					frames.push_back({ formula.left.get(), 0 });
				}
				else if (frame.visitedOperandCount == 1 && value == (formula.type == Formula::Types::And))
				{
					// the left operand did not decide the result
					frame.visitedOperandCount = 2;
					frames.push_back({ formula.right.get(), 0 });
				}
				else
				{
					frames.pop_back();
				}
				break;
			default:
				fatal2i("formula: unknown node type %d", int(formula.type));
		}
	}
	return value;
}

string __package_to_string(const Formula& formula)
{
	string result = string("\"") + formula.packageName + '"';
	if (!formula.constraints.empty())
	{
		result += " {";
		result += constraintsToString(formula.constraints);
		result += '}';
	}
	return result;
}

}

bool Formula::isSatisfiedBy(const string& candidateName, const Version& candidateVersion) const
{
	return __evaluate(*this, [&candidateName, &candidateVersion](const Formula& leaf)
	{
		return leaf.packageName == candidateName && satisfiesAll(leaf.constraints, candidateVersion);
	});
}

bool Formula::isSatisfiedBy(const Selection& selection) const
{
	return __evaluate(*this, [&selection](const Formula& leaf)
	{
		auto selectedVersion = selection.get(leaf.packageName);
		return selectedVersion && satisfiesAll(leaf.constraints, *selectedVersion);
	});
}

vector< string > Formula::getPackageNames() const
{
	vector< string > result;
	std::set< string > seen;

	vector< const Formula* > pending = { this };
	while (!pending.empty())
	{
		auto formula = pending.back();
		pending.pop_back();
		if (formula->type == Types::Package)
		{
			if (seen.insert(formula->packageName).second)
			{
				result.push_back(formula->packageName);
			}
			continue;
		}
		// pre-order, the left operand goes first
		if (formula->right)
		{
			pending.push_back(formula->right.get());
		}
		pending.push_back(formula->left.get());
	}
	return result;
}

bool Formula::containsNegation() const
{
	vector< const Formula* > pending = { this };
	while (!pending.empty())
	{
		auto formula = pending.back();
		pending.pop_back();
		switch (formula->type)
		{
			case Types::Package:
				break;
			case Types::And:
			case Types::Or:
				pending.push_back(formula->right.get());
				pending.push_back(formula->left.get());
				break;
			case Types::Not:
				return true;
		}
	}
	return false;
}

string Formula::toString() const
{
	struct Piece
	{
		const Formula* formula; // or, if empty, a literal
		bool parenthesized;
		const char* literal;
	};
	string result;
	vector< Piece > pieces = { { this, false, nullptr } };
	while (!pieces.empty())
	{
		auto piece = pieces.back();
		pieces.pop_back();
		if (!piece.formula)
		{
			result += piece.literal;
			continue;
		}
		if (piece.parenthesized)
		{
			result += '(';
			pieces.push_back({ nullptr, false, ")" });
		}

		// pieces are pushed in the reverse order
		const Formula& formula = *piece.formula;
		switch (formula.type)
		{
			case Types::Package:
				result += __package_to_string(formula);
				break;
			case Types::And:
				// chains are left-nested, so only a right-hand conjunction needs parentheses
				pieces.push_back({ formula.right.get(), __is_binary(*formula.right), nullptr });
				pieces.push_back({ nullptr, false, " & " });
				pieces.push_back({ formula.left.get(), formula.left->type == Types::Or, nullptr });
				break;
			case Types::Or:
				pieces.push_back({ formula.right.get(), formula.right->type == Types::Or, nullptr });
				pieces.push_back({ nullptr, false, " | " });
				pieces.push_back({ formula.left.get(), false, nullptr });
				break;
			case Types::Not:
				result += '!';
				pieces.push_back({ formula.left.get(), __is_binary(*formula.left), nullptr });
				break;
		}
	}
	return result;
}

bool Formula::operator==(const Formula& other) const
{
	vector< pair< const Formula*, const Formula* > > pending = { { this, &other } };
	while (!pending.empty())
	{
		auto nodes = pending.back();
		pending.pop_back();
		const Formula& first = *nodes.first;
		const Formula& second = *nodes.second;
		if (first.type != second.type)
		{
			return false;
		}
		switch (first.type)
		{
			case Types::Package:
				if (first.packageName != second.packageName || first.constraints != second.constraints)
				{
					return false;
				}
				break;
			case Types::And:
			case Types::Or:
				pending.push_back({ first.right.get(), second.right.get() });
				pending.push_back({ first.left.get(), second.left.get() });
				break;
			case Types::Not:
				pending.push_back({ first.left.get(), second.left.get() });
				break;
		}
	}
	return true;
}

SyntaxError::SyntaxError(const string& input, size_t position, const vector< string >& expected)
	: Exception(format2(__("unable to parse the formula '%s': position %zu: expected: %s"),
			input, position, join(__(" or "), expected))),
	__position(position), __expected(expected)
{}

shared_ptr< const Formula > parseFormula(const string& input)
{
	return internal::FormulaParser(input).parseFormula();
}

shared_ptr< const Formula > parseFormulaList(const string& input)
{
	return internal::FormulaParser(input).parseList();
}

bool checkPackageName(const string& packageName, bool throwOnError)
{
	static const sregex regex = sregex::compile("[A-Za-z0-9_.+-]+");
	auto result = regex_match(packageName, regex);
	if (!result && throwOnError)
	{
		fatal2(__("invalid package name '%s'"), packageName);
	}
	return result;
}

}
