// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Fork.hxx"
#include "Error.hxx"
#include "system/Error.hxx"

#include <unistd.h>

namespace ForkMap {

ForkSide
Fork()
{
	const pid_t pid = fork();
	if (pid < 0)
		throw ForkFailed{std::error_code{errno, ErrnoCategory()}};

	return ForkSide{pid};
}

} // namespace ForkMap
