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
#include <cstring>

#include <algorithm>

#include <internal/formulaparser.hpp>

namespace pkgformula {
namespace internal {

const size_t FormulaParser::__max_nesting_depth;

FormulaParser::FormulaParser(const string& input)
	: __input(input), __begin(input.begin()), __end(input.end()), __current(input.begin()),
	__nesting_depth(0)
{}

shared_ptr< const Formula > FormulaParser::parseFormula()
{
	__errors.clear();
	__current = __begin;
	__nesting_depth = 0;
	__skip_spaces();

	auto result = __formula();
	if (__current != __end)
	{
		__maybe_error(Lexem::End);
		__error_out();
	}
	return result;
}

shared_ptr< const Formula > FormulaParser::parseList()
{
	__errors.clear();
	__current = __begin;
	__nesting_depth = 0;
	__skip_spaces();

	shared_ptr< const Formula > result;
	while (__current != __end)
	{
		// list items are written next to each other, without a connective
		auto item = __formula();
		result = result ? Formula::makeAnd(result, item) : item;
	}
	return result;
}

shared_ptr< const Formula > FormulaParser::__formula()
{
	auto result = __and_expression();
	while (__lexem("|", Lexem::Or))
	{
		result = Formula::makeOr(result, __and_expression());
	}
	return result;
}

shared_ptr< const Formula > FormulaParser::__and_expression()
{
	auto result = __term();
	while (__lexem("&", Lexem::And))
	{
		result = Formula::makeAnd(result, __term());
	}
	return result;
}

shared_ptr< const Formula > FormulaParser::__term()
{
	auto termStart = __current;
	if (__negation())
	{
		__enter_nested(termStart);
		auto result = Formula::makeNot(__term());
		--__nesting_depth;
		return result;
	}
	if (__lexem("(", Lexem::OpeningParenthesis))
	{
		__enter_nested(termStart);
		auto result = __formula();
		if (!__lexem(")", Lexem::ClosingParenthesis))
		{
			__error_out();
		}
		--__nesting_depth;
		return result;
	}
	auto result = __atom();
	if (!result)
	{
		__error_out();
	}
	return result;
}

shared_ptr< const Formula > FormulaParser::__atom()
{
	auto nameStart = __current;
	if (!__package_name())
	{
		return shared_ptr< const Formula >();
	}
	string packageName = __read;
	if (!checkPackageName(packageName, false))
	{
		__error_out(nameStart, Lexem::PackageName);
	}

	vector< Constraint > constraints;
	if (__lexem("{", Lexem::OpeningBrace))
	{
		__constraints(constraints);
		if (!__lexem("}", Lexem::ClosingBrace))
		{
			__error_out();
		}
	}
	return Formula::makePackage(packageName, constraints);
}

void FormulaParser::__constraints(vector< Constraint >& result)
{
	result.push_back(__constraint());
	while (__lexem("&", Lexem::And))
	{
		result.push_back(__constraint());
	}
}

Constraint FormulaParser::__constraint()
{
	auto constraintStart = __current;
	if (__negation())
	{
		__enter_nested(constraintStart);
		auto negated = __constraint();
		--__nesting_depth;
		return Constraint(Constraint::Comparators::negate(negated.comparator), negated.version);
	}
	if (__lexem("(", Lexem::OpeningParenthesis))
	{
		__enter_nested(constraintStart);
		auto result = __constraint();
		if (!__lexem(")", Lexem::ClosingParenthesis))
		{
			__error_out();
		}
		--__nesting_depth;
		return result;
	}

	auto comparator = Constraint::Comparators::Equal;
	if (!__comparator(comparator))
	{
		__error_out();
	}
	auto versionStart = __current;
	if (!__version_string())
	{
		__error_out();
	}
	if (!checkVersionString(__read, false))
	{
		__error_out(versionStart, Lexem::WellFormedVersionString);
	}
	return Constraint(comparator, Version(__read));
}

bool FormulaParser::__package_name()
{
	return __quoted(Lexem::PackageName);
}

bool FormulaParser::__version_string()
{
	return __quoted(Lexem::VersionString);
}

bool FormulaParser::__quoted(Lexem::Type type)
{
	static const sregex regex = sregex::compile("\"([^\"]*)\"");
	if (__current != __end && *__current == '"')
	{
		if (!regex_search(__current, __end, __m, regex, regex_constants::match_continuous))
		{
			__error_out(__end, Lexem::ClosingQuote);
		}
		__read = __m[1].str();
		__current = __m[0].second;
		__skip_spaces();
		__errors.clear();
		return true;
	}
	__maybe_error(type);
	return false;
}

bool FormulaParser::__comparator(Constraint::Comparators::Type& comparator)
{
	static const sregex regex = sregex::compile("[<>=!~]+");
	auto comparatorStart = __current;
	if (!__regex(regex))
	{
		__maybe_error(Lexem::Comparator);
		return false;
	}
	if (!Constraint::Comparators::parse(__read, comparator))
	{
		__error_out(comparatorStart, Lexem::Comparator);
	}
	return true;
}

bool FormulaParser::__negation()
{
	// '!' which does not start '!='
	static const sregex regex = sregex::compile("!(?!=)");
	auto result = __regex(regex);
	if (!result)
	{
		__maybe_error(Lexem::Not);
	}
	return result;
}

bool FormulaParser::__lexem(const char* str, Lexem::Type type)
{
	ssize_t length = strlen(str);
	if (__end - __current >= length && memcmp(&*__current, str, length) == 0)
	{
		__read.assign(__current, __current + length);
		__current += length;
		__skip_spaces();
		__errors.clear();
		return true;
	}
	__maybe_error(type);
	return false;
}

bool FormulaParser::__regex(const sregex& regex)
{
	sci previous = __current;
	if (regex_search(__current, __end, __m, regex, regex_constants::match_continuous))
	{
		// accepted the term
		__current = __m[0].second;
		__read.assign(previous, __current);
		__skip_spaces();
		__errors.clear();
		return true;
	}
	else
	{
		return false;
	}
}

void FormulaParser::__skip_spaces()
{
	while (__current != __end && isspace((unsigned char)*__current))
	{
		++__current;
	}
}

void FormulaParser::__enter_nested(sci position)
{
	if (__nesting_depth == __max_nesting_depth)
	{
		__error_out(position, Lexem::ShallowerNesting);
	}
	++__nesting_depth;
}

void FormulaParser::__maybe_error(Lexem::Type type)
{
	__errors.push_back(type);
}

string FormulaParser::__get_lexem_description(Lexem::Type type)
{
	switch (type)
	{
		case Lexem::PackageName: return __("package name (quoted; letters, numbers, underscores, points, pluses, dashes allowed)");
		case Lexem::VersionString: return __("version string (quoted)");
		case Lexem::WellFormedVersionString: return __("well-formed version string (non-empty dot-separated parts, no spaces or formula punctuation)");
		case Lexem::ClosingQuote: return __("closing quote ('\"')");
		case Lexem::Comparator: return __("comparator ('=', '!=', '<', '<=', '>', '>=')");
		case Lexem::And: return __("conjunction ('&')");
		case Lexem::Or: return __("disjunction ('|')");
		case Lexem::Not: return __("negation ('!')");
		case Lexem::OpeningParenthesis: return __("opening parenthesis ('(')");
		case Lexem::ClosingParenthesis: return __("closing parenthesis (')')");
		case Lexem::OpeningBrace: return __("opening curly bracket ('{')");
		case Lexem::ClosingBrace: return __("closing curly bracket ('}')");
		case Lexem::ShallowerNesting: return format2(__("at most %zu nested negations and parentheses"),
				__max_nesting_depth);
		case Lexem::End: return __("end of the formula");
		default:
			fatal2i("no description for lexem #%d", int(type));
	}
	return string(); // unreachable
}

void FormulaParser::__error_out()
{
	vector< string > lexemDescriptions;
	for (auto type: __errors)
	{
		auto description = __get_lexem_description(type);
		if (std::find(lexemDescriptions.begin(), lexemDescriptions.end(), description) ==
				lexemDescriptions.end())
		{
			lexemDescriptions.push_back(description);
		}
	}
	fatal2x(SyntaxError(__input, __current - __begin, lexemDescriptions));
}

void FormulaParser::__error_out(sci position, Lexem::Type type)
{
	__current = position;
	__errors.assign(1, type);
	__error_out();
}

} // namespace
} // namespace
