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
#ifndef PKGFORMULA_CONSTRAINT_SEEN
#define PKGFORMULA_CONSTRAINT_SEEN

/// @file

#include <pkgformula/common.hpp>
#include <pkgformula/versionstring.hpp>

namespace pkgformula {

/// version constraint of a package reference
struct PKGFORMULA_API Constraint
{
	/// comparators
	struct Comparators
	{
		/// type
		enum Type { Equal, NotEqual, Less, LessOrEqual, More, MoreOrEqual };
		/// string values of corresponding types
		static const string strings[];
		/// gets the comparator which holds exactly when @a type does not
		static Type negate(Type type);
		/// parses a comparator token
		/**
		 * @param input comparator token
		 * @param [out] type parsed comparator, not modified on failure
		 * @return @c true on success
		 */
		static bool parse(const string& input, Type& type);
	};

	Comparators::Type comparator; ///< comparator
	Version version; ///< version to compare against

	/// constructor
	Constraint(Comparators::Type comparator_, const Version& version_)
		: comparator(comparator_), version(version_)
	{}

	/// is the constraint satisfied by @a candidate
	/**
	 * @return @c true iff @c candidate @c <comparator> @ref version
	 */
	bool holds(const Version& candidate) const;
	/// gets the string representation, e.g. <tt>>= "2.0.0"</tt>
	string toString() const;

	bool operator==(const Constraint& other) const;
	bool operator!=(const Constraint& other) const { return !(*this == other); }
};

/// checks whether @a candidate satisfies all @a constraints
bool PKGFORMULA_API satisfiesAll(const vector< Constraint >& constraints, const Version& candidate);

/// gets the string representation of a constraint conjunction, without braces
string PKGFORMULA_API constraintsToString(const vector< Constraint >& constraints);

}

#endif

