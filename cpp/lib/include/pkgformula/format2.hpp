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
// only for internal inclusion
/// @cond

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <string>
#include <vector>

namespace pkgformula {

using std::string;

namespace internal {
namespace format2impl {

// printf-family functions know nothing about std::string
inline const char* toPrintable(const string& s)
{
	return s.c_str();
}

template < typename T >
const T& toPrintable(const T& value)
{
	return value;
}

template < typename... Args >
string printfToString(const char* format, Args... args)
{
	char formattedBuffer[1024];

	auto bytesWritten = snprintf(formattedBuffer, sizeof(formattedBuffer), format, args...);
	if (bytesWritten < 0)
	{
		return string(format);
	}
	if (size_t(bytesWritten) < sizeof(formattedBuffer))
	{
		return string(formattedBuffer, bytesWritten);
	}

	// we need a bigger buffer
	std::vector< char > dynamicBuffer(bytesWritten + 1);
	snprintf(dynamicBuffer.data(), dynamicBuffer.size(), format, args...);
	return string(dynamicBuffer.data(), bytesWritten);
}

}
}

// now public parts

template < typename... Args >
string format2(const char* format, const Args&... args)
{
	return internal::format2impl::printfToString(format,
			internal::format2impl::toPrintable(args)...);
}

template < typename... Args >
string format2(const string& format, const Args&... args)
{
	return format2(format.c_str(), args...);
}

template < typename... Args >
string format2e(const string& format, const Args&... args)
{
	char errorBuffer[255] = "?";
	// error message may not go to errorBuffer, see man strerror_r (GNU version)
	auto errorString = strerror_r(errno, errorBuffer, sizeof(errorBuffer));

	return format2(format, args...) + ": " + errorString;
}

PKGFORMULA_API void __mwrite_line(const char*, const string&);

template < typename... Args >
void fatal2(const string& format, const Args&... args)
{
	auto errorString = format2(format, args...);
	__mwrite_line("E: ", errorString);
	throw Exception(errorString);
}

template < typename... Args >
void fatal2i(const char* format, const Args&... args)
{
	fatal2((string("internal error: ") + format), args...);
}

template < typename... Args >
void fatal2e(const string& format, const Args&... args)
{
	auto errorString = format2e(format, args...);
	__mwrite_line("E: ", errorString);
	throw Exception(errorString);
}

// reports an already constructed descendant of Exception
template < typename ExceptionT >
void fatal2x(const ExceptionT& exception)
{
	__mwrite_line("E: ", exception.what());
	throw exception;
}

template < typename... Args >
void warn2(const string& format, const Args&... args)
{
	__mwrite_line("W: ", format2(format, args...));
}

template < typename... Args >
void debug2(const char* format, const Args&... args)
{
	__mwrite_line("D: ", format2(format, args...));
}

}

/// @endcond

