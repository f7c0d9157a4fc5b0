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
#ifndef PKGFORMULA_VERSIONSTRING_SEEN
#define PKGFORMULA_VERSIONSTRING_SEEN

/// @file

#include <pkgformula/common.hpp>

namespace pkgformula {

/// thrown when a version string cannot be parsed
class PKGFORMULA_API MalformedVersion: public Exception
{
	string __input;
 public:
	/// constructor
	/**
	 * @param input offending version string
	 * @param reason human-readable description of the problem
	 */
	MalformedVersion(const string& input, const string& reason);
	/// gets the offending version string
	const string& getInput() const { return __input; }
};

/// parsed package version
/**
 * A version is a sequence of segments. Segments are separated by dots and
 * by the boundaries between digit and non-digit runs, so @c "1.10rc2"
 * consists of @c 1, @c 10, @c rc and @c 2.
 *
 * Ordering policy:
 *  - numeric segments compare numerically (leading zeroes are ignored);
 *  - textual segments compare lexically;
 *  - a numeric segment is greater than a textual segment at the same position;
 *  - a missing segment is less than any present one, so @c "1.0" < @c "1.0.0".
 *
 * Versions are immutable once parsed.
 */
class PKGFORMULA_API Version
{
 public:
	/// version segment
	struct Segment
	{
		/// segment type
		struct Types
		{
			enum Type { Number, Text };
		};
		Types::Type type; ///< segment type
		string value; ///< digits without leading zeroes for numbers, text otherwise

		bool operator==(const Segment&) const;
	};

	/// constructor
	/**
	 * Parses @a input.
	 *
	 * @param input version string
	 * @throw MalformedVersion on empty input, empty dot-separated parts or
	 * forbidden characters
	 */
	explicit Version(const string& input);

	/// gets the version string as it was given
	const string& toString() const { return __original; }
	/// gets parsed segments
	const vector< Segment >& getSegments() const { return __segments; }

	/// compares two versions
	/**
	 * @return @c -1, if @c *this @c < @a other, @c 0 if they are equal, @c 1 otherwise
	 */
	int compare(const Version& other) const;

	bool operator<(const Version& other) const { return compare(other) < 0; }
	bool operator>(const Version& other) const { return compare(other) > 0; }
	bool operator<=(const Version& other) const { return compare(other) <= 0; }
	bool operator>=(const Version& other) const { return compare(other) >= 0; }
	bool operator==(const Version& other) const { return compare(other) == 0; }
	bool operator!=(const Version& other) const { return compare(other) != 0; }
 private:
	string __original;
	vector< Segment > __segments;
};

/// checks version string for correctness
/**
 * @param versionString version string to check
 * @param throwOnError if @c true, throws MalformedVersion instead of returning @c false
 * @return @c true if @a versionString can be parsed as Version
 */
bool PKGFORMULA_API checkVersionString(const string& versionString, bool throwOnError = true);

/// compares two version strings
/**
 * @param left left version string
 * @param right right version string
 * @return @c -1, if @a left @c < @a right, @c 0 if @a left @c == @a right, @c 1 if @a left @c > @a right
 * @throw MalformedVersion if any of the strings is not a valid version
 */
int PKGFORMULA_API compareVersionStrings(const string& left, const string& right);

}

#endif

