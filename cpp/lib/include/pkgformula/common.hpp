/**************************************************************************
*   Copyright (C) 2010-2011 by Eugene V. Lyubimkin                        *
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
#ifndef PKGFORMULA_COMMON_SEEN
#define PKGFORMULA_COMMON_SEEN

/*! @file
 * Declarations shared by every part of libpkgformula: the exception type,
 * the message channel and the localisation helpers.
 */

/// @cond
#define PKGFORMULA_API __attribute__ ((visibility("default")))
#define PKGFORMULA_LOCAL __attribute__ ((visibility("hidden")))
// marks a string for translation, __() translates it later
#define N__(arg) arg
/// @endcond

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/** @namespace pkgformula */
namespace pkgformula {

using std::string;
using std::vector;
using std::pair;
using std::shared_ptr;
using std::unique_ptr;

/// base of everything libpkgformula throws
/**
 * Malformed versions, formula syntax errors, bad configuration and I/O
 * failures all end up here. An unsatisfiable request is not an exception:
 * the resolver returns it as a conflict.
 *
 * Before a library function throws, it writes the message to @ref messageFd
 * with an @c "E: " prefix, so callers which only need the text may catch
 * the exception and stay silent.
 */
class PKGFORMULA_API Exception: public std::runtime_error
{
 public:
	/// @param message human-readable description
	Exception(const char* message)
		: std::runtime_error(message)
	{}
	/// @param message human-readable description
	Exception(const string& message)
		: std::runtime_error(message)
	{}
};

/// where error (@c E:), warning (@c W:) and debug (@c D:) lines go
/**
 * A file descriptor, @c -1 (the default) discards the messages. The console
 * sets it to the standard error.
 */
PKGFORMULA_API extern int messageFd;

/// version of the library, as passed to the build
PKGFORMULA_API extern const char* const libraryVersion;

/// translates @a message in the @c pkgformula gettext domain
PKGFORMULA_API const char* __(const char* message);

/// @cond
PKGFORMULA_API string join(const string& joiner, const vector< string >& parts);
/// @endcond

} // namespace

#include <pkgformula/format2.hpp>

#endif
