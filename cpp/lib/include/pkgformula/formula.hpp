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
#ifndef PKGFORMULA_FORMULA_SEEN
#define PKGFORMULA_FORMULA_SEEN

/// @file

#include <pkgformula/common.hpp>
#include <pkgformula/constraint.hpp>

namespace pkgformula {

class Selection;

/// dependency formula
/**
 * A tagged tree node. Depending on @ref type, different members are
 * meaningful:
 *  - @c Package: @ref packageName and @ref constraints (a conjunction, may be empty);
 *  - @c And, @c Or: @ref left and @ref right;
 *  - @c Not: @ref left only.
 *
 * Formulas are immutable and are shared between owners, nodes are created
 * only through the @c make* functions. Trees of any depth are supported:
 * traversals and the destructor do not recurse.
 */
struct PKGFORMULA_API Formula
{
	/// node type
	struct Types
	{
		enum Type { Package, And, Or, Not };
	};

	const Types::Type type; ///< node type
	const string packageName; ///< package name, non-empty for @c Package
	const vector< Constraint > constraints; ///< version constraints for @c Package
	shared_ptr< const Formula > left; ///< left operand, or the negated formula for @c Not
	shared_ptr< const Formula > right; ///< right operand

	/// makes a package reference
	/**
	 * @param packageName non-empty package name
	 * @param constraints version constraints, all of them must hold
	 */
	static shared_ptr< const Formula > makePackage(const string& packageName,
			const vector< Constraint >& constraints = vector< Constraint >());
	/// makes a conjunction
	static shared_ptr< const Formula > makeAnd(const shared_ptr< const Formula >& left,
			const shared_ptr< const Formula >& right);
	/// makes a disjunction
	static shared_ptr< const Formula > makeOr(const shared_ptr< const Formula >& left,
			const shared_ptr< const Formula >& right);
	/// makes a negation
	static shared_ptr< const Formula > makeNot(const shared_ptr< const Formula >& inner);

	~Formula();

	/// evaluates the formula against a single candidate
	/**
	 * A package reference is true iff it names @a packageName and all its
	 * constraints hold for @a version.
	 */
	bool isSatisfiedBy(const string& packageName, const Version& version) const;
	/// evaluates the formula against a selection
	/**
	 * A package reference is true iff the package is selected and the
	 * selected version satisfies all its constraints. Operands are
	 * evaluated left to right with short-circuiting.
	 */
	bool isSatisfiedBy(const Selection& selection) const;

	/// gets names of referenced packages, in pre-order, without duplicates
	vector< string > getPackageNames() const;
	/// checks whether a negation is present anywhere in the tree
	/**
	 * If not, the formula can only turn from @c false to @c true when
	 * packages are added to a selection, never back.
	 */
	bool containsNegation() const;

	/// gets the canonical string representation
	/**
	 * Parsing the result gives a structurally equal formula.
	 */
	string toString() const;

	/// structural equality
	bool operator==(const Formula& other) const;
	bool operator!=(const Formula& other) const { return !(*this == other); }
 private:
	PKGFORMULA_LOCAL Formula(Types::Type, const string&, const vector< Constraint >&,
			const shared_ptr< const Formula >&, const shared_ptr< const Formula >&);
};

/// thrown when a formula text violates the grammar
class PKGFORMULA_API SyntaxError: public Exception
{
	size_t __position;
	vector< string > __expected;
 public:
	/// constructor
	/**
	 * @param input the whole text being parsed
	 * @param position zero-based offset of the offending character
	 * @param expected human-readable descriptions of what was expected there
	 */
	SyntaxError(const string& input, size_t position, const vector< string >& expected);
	/// gets zero-based offset of the error in the input
	size_t getPosition() const { return __position; }
	/// gets descriptions of the acceptable lexems at the error position
	const vector< string >& getExpected() const { return __expected; }
};

/// parses a formula
/**
 * @param input formula text, e.g. <tt>"B" {>= "2.0.0"} & ("C" | "D")</tt>
 * @return the formula tree
 * @throw SyntaxError
 */
PKGFORMULA_API shared_ptr< const Formula > parseFormula(const string& input);

/// parses a whitespace-separated list of formulas
/**
 * This is the form of the body of the opam @c depends field. List items are
 * joined by conjunction, left to right.
 *
 * @param input formula list text
 * @return the conjunction of all items, or an empty pointer if the list is empty
 * @throw SyntaxError
 */
PKGFORMULA_API shared_ptr< const Formula > parseFormulaList(const string& input);

/// checks package name for correctness
/**
 * Allowed characters are latin letters, digits and <tt>_ . + -</tt>.
 *
 * @param packageName package name to check
 * @param throwOnError if @c true, the function throws instead of returning @c false
 */
PKGFORMULA_API bool checkPackageName(const string& packageName, bool throwOnError = true);

}

#endif

