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
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>

#include <pkgformula/file.hpp>

namespace pkgformula {
namespace internal {

struct FileImpl
{
	FILE* handle;
	const string path;
	int fd;

	FileImpl(const string& path_, const char* mode, string& openError);
	~FileImpl();
	inline void assertFileOpened() const;
};

FileImpl::FileImpl(const string& path_, const char* mode, string& openError)
	: handle(NULL), path(path_), fd(-1)
{
	handle = fopen(path.c_str(), mode);
	if (!handle)
	{
		openError = format2e("").substr(2);
		return;
	}

	// setting FD_CLOEXEC flag
	fd = fileno(handle);
	int oldFdFlags = fcntl(fd, F_GETFD);
	if (oldFdFlags < 0)
	{
		openError = format2e("unable to get file descriptor flags");
	}
	else if (fcntl(fd, F_SETFD, oldFdFlags | FD_CLOEXEC) == -1)
	{
		openError = format2e("unable to set the close-on-exec flag");
	}
}

FileImpl::~FileImpl()
{
	if (handle && fclose(handle))
	{
		// destructors must not throw
		warn2(__("unable to close the file '%s'"), path);
	}
}

void FileImpl::assertFileOpened() const
{
	if (!handle)
	{
		// file was not properly opened
		fatal2i("file '%s' was not properly opened", path);
	}
}

}

File::File(const string& path, const char* mode)
	: __impl(NULL)
{
	string openError;
	unique_ptr< internal::FileImpl > impl(new internal::FileImpl(path, mode, openError));
	if (!openError.empty())
	{
		fatal2(__("unable to open the file '%s': %s"), path, openError);
	}
	__impl = impl.release();
}

File::~File()
{
	delete __impl;
}

void File::getFile(string& block)
{
	__impl->assertFileOpened();

	block.clear();

	char buffer[4096];
	size_t readLength;
	while ((readLength = fread(buffer, 1, sizeof(buffer), __impl->handle)) > 0)
	{
		block.append(buffer, readLength);
	}
	if (ferror(__impl->handle))
	{
		fatal2e(__("unable to read from the file '%s'"), __impl->path);
	}
}

void File::put(const string& data)
{
	__impl->assertFileOpened();
	if (!data.empty() && fwrite(data.c_str(), data.size(), 1, __impl->handle) != 1)
	{
		fatal2e(__("unable to write to the file '%s'"), __impl->path);
	}
}

void File::unbufferedPut(const char* data, size_t size)
{
	__impl->assertFileOpened();
	fflush(__impl->handle);

	size_t currentOffset = 0;
	while (currentOffset < size)
	{
		auto writeResult = write(__impl->fd, data + currentOffset, size - currentOffset);
		if (writeResult == -1)
		{
			if (errno == EINTR)
			{
				continue;
			}
			else
			{
				fatal2e(__("unable to write to the file '%s'"), __impl->path);
			}
		}
		currentOffset += writeResult;
	}
}

RequiredFile::RequiredFile(const string& path, const char* mode)
	: File(path, mode)
{}

} // namespace
