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
#ifndef COMMON_SEEN
#define COMMON_SEEN

#include <pkgformula/common.hpp>
#include <pkgformula/config.hpp>
#include <pkgformula/formula.hpp>
#include <pkgformula/resolver.hpp>
#include <pkgformula/selection.hpp>
#include <pkgformula/universe.hpp>
#include <pkgformula/versionstring.hpp>

using namespace pkgformula;

#endif
