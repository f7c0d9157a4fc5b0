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
#ifndef PKGFORMULA_SELECTION_SEEN
#define PKGFORMULA_SELECTION_SEEN

/// @file

#include <map>

#include <pkgformula/common.hpp>
#include <pkgformula/versionstring.hpp>

namespace pkgformula {

class Universe;

/// chosen versions, at most one per package name
class PKGFORMULA_API Selection
{
	std::map< string, Version > __versions;
 public:
	typedef std::map< string, Version >::const_iterator const_iterator;

	/// gets the selected version of the package
	/**
	 * @return pointer to the version, or @c nullptr if the package is not selected
	 */
	const Version* get(const string& packageName) const;
	bool contains(const string& packageName) const;
	/// selects @a version of the package, replacing the previous choice if any
	void set(const string& packageName, const Version& version);
	void erase(const string& packageName);

	size_t size() const { return __versions.size(); }
	bool empty() const { return __versions.empty(); }

	/// iteration is ordered by package name
	const_iterator begin() const { return __versions.begin(); }
	const_iterator end() const { return __versions.end(); }

	/// gets representation like <tt>A 3.0.0, B 2.0.0</tt>
	string toString() const;

	bool operator==(const Selection& other) const;
	bool operator!=(const Selection& other) const { return !(*this == other); }
};

/// resolved dependency graph
/**
 * Maps every selected package to the selected packages its formula relied
 * on: both operands of a conjunction, the first true operand of a
 * disjunction, nothing under a negation. Neighbours are listed in the order
 * they appear in the formula.
 *
 * @param universe the universe @a selection was computed over
 * @param selection a consistent selection
 */
PKGFORMULA_API std::map< string, vector< string > > getDependencyGraph(
		const Universe& universe, const Selection& selection);

/// gets the shortest chain of dependencies from @a root to @a target
/**
 * @return package names starting with @a root and ending with @a target,
 * or an empty vector if @a target is not reachable
 */
PKGFORMULA_API vector< string > getDependencyChain(const Universe& universe,
		const Selection& selection, const string& root, const string& target);

}

#endif
