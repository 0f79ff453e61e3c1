// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FileDescriptor.hxx"
#include "system/Error.hxx"

#include <stdexcept>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

bool
FileDescriptor::Open(const char *pathname, int flags, mode_t mode) noexcept
{
	fd = ::open(pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::Close() noexcept
{
	return ::close(Steal()) == 0;
}

ssize_t
FileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return ::read(fd, dest.data(), dest.size());
}

ssize_t
FileDescriptor::Write(std::span<const std::byte> src) const noexcept
{
	return ::write(fd, src.data(), src.size());
}

void
FileDescriptor::FullWrite(std::span<const std::byte> src) const
{
	while (!src.empty()) {
		ssize_t nbytes = Write(src);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to write");
		}

		if (nbytes == 0)
			throw std::runtime_error("Short write");

		src = src.subspan(nbytes);
	}
}
