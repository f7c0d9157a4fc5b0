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
#ifndef PKGFORMULA_INTERNAL_FILESYSTEM_SEEN
#define PKGFORMULA_INTERNAL_FILESYSTEM_SEEN

#include <pkgformula/common.hpp>

namespace pkgformula {
namespace internal {
namespace fs {

string filename(const string& path);
string dirname(const string& path);
// results are sorted
vector< string > glob(const string& pattern);
bool fileExists(const string& path);
bool dirExists(const string& path);
void mkpath(const string& path);

}
}
}

#endif
