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
#ifndef PKGFORMULA_FILE_SEEN
#define PKGFORMULA_FILE_SEEN

/// @file

#include <pkgformula/common.hpp>

namespace pkgformula {

namespace internal {

struct FileImpl;

}

/// high-level interface to file routines
/**
 * Instances are created through @ref RequiredFile.
 */
class PKGFORMULA_API File
{
	internal::FileImpl* __impl;

	File(const File&) = delete;
 public:
	/// destructor
	virtual ~File();

	/// reads all available data from current position
	/**
	 * @param block container for read data
	 */
	void getFile(string& block);
	/// writes data
	void put(const string& data);
	/// @cond
	void unbufferedPut(const char* data, size_t size);
	/// @endcond
 protected:
	/// opens the file or throws
	File(const string& path, const char* mode);
};

// File wrapper which throws on open errors
class PKGFORMULA_API RequiredFile: public File
{
 public:
	/*
	 * Opens @a path with @a mode as @c fopen(3) does, throws the exception if
	 * that fails.
	 */
	RequiredFile(const string& path, const char* mode);
};

} // namespace

#endif
