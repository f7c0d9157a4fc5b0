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
#ifndef PKGFORMULA_REPOSITORY_SEEN
#define PKGFORMULA_REPOSITORY_SEEN

/// @file

#include <pkgformula/common.hpp>
#include <pkgformula/universe.hpp>

namespace pkgformula {

/// extracts a package record from an opam file
/**
 * Reads the @c name, @c version and @c depends fields. A missing name or
 * version is taken from the name of the containing directory, which is
 * <tt>\<name\>.\<version\></tt>. A missing @c depends field means no
 * dependencies. The formula text is not parsed here.
 *
 * @param text file contents
 * @param path file path, used for the fallback and for messages
 * @throw Exception if the name or the version cannot be determined or the
 * @c depends list is not terminated
 */
PKGFORMULA_API PackageRecord parseOpamFile(const string& text, const string& path);

/// reads all package records of an opam-style repository
/**
 * Reads files <tt>packages/\<name\>/\<name\>.\<version\>/opam</tt> under
 * @a directory. If there is no @c packages subdirectory, @a directory itself
 * is taken as one. Unreadable files are skipped with a warning.
 *
 * @param directory repository directory
 * @return records, sorted by file path
 * @throw Exception if the directory does not exist
 */
PKGFORMULA_API vector< PackageRecord > readRepository(const string& directory);

}

#endif
