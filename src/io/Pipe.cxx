// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Pipe.hxx"
#include "system/Error.hxx"

#include <fcntl.h>
#include <unistd.h>

std::pair<UniqueFileDescriptor, UniqueFileDescriptor>
CreatePipe()
{
	int p[2];
	if (pipe2(p, O_CLOEXEC))
		throw MakeErrno("pipe2() failed");

	return {
		UniqueFileDescriptor{p[0]},
		UniqueFileDescriptor{p[1]},
	};
}
