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
#ifndef PKGFORMULA_INTERNAL_FORMULAPARSER_SEEN
#define PKGFORMULA_INTERNAL_FORMULAPARSER_SEEN

#include <common/regex.hpp>

#include <pkgformula/formula.hpp>

namespace pkgformula {
namespace internal {

// recursive descent parser of dependency formulas
class FormulaParser
{
	typedef string::const_iterator sci;

	struct Lexem
	{
		enum Type { PackageName, VersionString, WellFormedVersionString, ClosingQuote, Comparator,
				And, Or, Not, OpeningParenthesis, ClosingParenthesis, OpeningBrace, ClosingBrace,
				ShallowerNesting, End };
	};
	static const size_t __max_nesting_depth = 512;

	const string& __input;
	sci __begin;
	sci __end;
	sci __current;
	vector< Lexem::Type > __errors;
	string __read;
	size_t __nesting_depth;

	smatch __m;

	shared_ptr< const Formula > __formula();
	shared_ptr< const Formula > __and_expression();
	shared_ptr< const Formula > __term();
	shared_ptr< const Formula > __atom();
	void __constraints(vector< Constraint >&);
	Constraint __constraint();

	bool __package_name();
	bool __version_string();
	bool __quoted(Lexem::Type);
	bool __comparator(Constraint::Comparators::Type&);
	bool __negation();
	bool __lexem(const char*, Lexem::Type);
	bool __regex(const sregex&);
	void __skip_spaces();
	void __enter_nested(sci);
	void __maybe_error(Lexem::Type);

	static string __get_lexem_description(Lexem::Type type);
	void __error_out();
	void __error_out(sci position, Lexem::Type);
 public:
	explicit FormulaParser(const string& input);

	shared_ptr< const Formula > parseFormula();
	shared_ptr< const Formula > parseList();
};

} // namespace
} // namespace

#endif
