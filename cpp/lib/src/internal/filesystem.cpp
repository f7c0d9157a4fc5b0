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
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <libgen.h>
#include <glob.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include <internal/filesystem.hpp>

namespace pkgformula {
namespace internal {
namespace fs {

string filename(const string& path)
{
	char* pathCopy = strdup(path.c_str());
	string result(::basename(pathCopy));
	free(pathCopy);

	return result;
}

string dirname(const string& path)
{
	char* pathCopy = strdup(path.c_str());
	string result(::dirname(pathCopy));
	free(pathCopy);

	return result;
}

vector< string > glob(const string& pattern)
{
	vector< string > strings;

	glob_t globResult;
	auto result = ::glob(pattern.c_str(), 0, NULL, &globResult);
	if (result != 0 && result != GLOB_NOMATCH)
	{
		globfree(&globResult);
		fatal2e(__("%s() failed: '%s'"), "glob", pattern);
	}
	for (size_t i = 0; i < globResult.gl_pathc; ++i)
	{
		strings.push_back(string(globResult.gl_pathv[i]));
	}
	globfree(&globResult);
	return strings;
}

namespace {

bool __stat(const string& path, struct stat* result)
{
	auto error = stat(path.c_str(), result);
	if (error)
	{
		if (errno == ENOENT || errno == ENOTDIR)
		{
			return false;
		}
		else
		{
			fatal2e(__("%s() failed: '%s'"), "stat", path);
		}
	}
	return true;
}

}

bool fileExists(const string& path)
{
	struct stat s;
	return __stat(path, &s) && (S_ISREG(s.st_mode) || S_ISFIFO(s.st_mode));
}

bool dirExists(const string& path)
{
	struct stat s;
	return __stat(path, &s) && S_ISDIR(s.st_mode);
}

void mkpath(const string& path)
{
	auto ensureDirectoryExist = [](const string& pathPart)
	{
		if (mkdir(pathPart.c_str(), 0755) == -1)
		{
			if (errno != EEXIST && errno != EISDIR)
			{
				fatal2e(__("unable to create the directory '%s'"), pathPart);
			}
		}
	};

	size_t position = 0;
	while (position = path.find('/', ++position), position != string::npos)
	{
		ensureDirectoryExist(path.substr(0, position));
	}
	ensureDirectoryExist(path);
}

}
}
}
