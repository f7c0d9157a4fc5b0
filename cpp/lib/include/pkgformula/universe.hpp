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
#ifndef PKGFORMULA_UNIVERSE_SEEN
#define PKGFORMULA_UNIVERSE_SEEN

/// @file

#include <map>

#include <pkgformula/common.hpp>
#include <pkgformula/versionstring.hpp>
#include <pkgformula/formula.hpp>

namespace pkgformula {

/// raw package version description, as read from package metadata
struct PKGFORMULA_API PackageRecord
{
	string name; ///< package name
	string versionString; ///< version string
	string formulaText; ///< dependency formula list, may be empty
	string origin; ///< where the record came from, used in messages only
};

/// known packages, their versions and dependency formulas
/**
 * The universe is filled once and is read-only afterwards, so it may be
 * shared between concurrent resolutions.
 */
class PKGFORMULA_API Universe
{
 public:
	/// available package version
	struct Entry
	{
		Version version; ///< version
		/// dependency formula, empty if the version has no dependencies
		shared_ptr< const Formula > formula;
	};

	/// adds a package version
	/**
	 * @param packageName package name
	 * @param version version
	 * @param formula dependency formula, may be empty
	 * @return @c false if this version of the package was already present,
	 * the universe stays unchanged then
	 */
	bool add(const string& packageName, const Version& version,
			const shared_ptr< const Formula >& formula);

	bool hasPackage(const string& packageName) const;
	/// gets versions of the package, newest first
	/**
	 * @return the entries, or an empty vector if the package is unknown
	 */
	const vector< Entry >& getEntries(const string& packageName) const;
	/// gets a specific version of the package
	/**
	 * @return pointer to the entry, or @c nullptr if there is no such version
	 */
	const Entry* getEntry(const string& packageName, const Version& version) const;
	/// gets all package names, sorted
	vector< string > getPackageNames() const;
	/// gets the total count of package versions
	size_t getVersionCount() const;
 private:
	std::map< string, vector< Entry > > __entries;
};

/// builds a universe from raw records
/**
 * A record with an invalid package name, a malformed version or an
 * unparsable formula is skipped with a warning, the rest are loaded. So are
 * duplicate versions.
 *
 * @param records records
 * @param [out] errors if not @c nullptr, descriptions of skipped records are appended here
 */
PKGFORMULA_API Universe loadUniverse(const vector< PackageRecord >& records,
		vector< string >* errors = nullptr);

}

#endif
