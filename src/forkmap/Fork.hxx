// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cassert>

#include <sys/types.h>

namespace ForkMap {

/**
 * Tells a caller of Fork() on which side of the fork it is running.
 */
class ForkSide {
	pid_t pid;

public:
	explicit constexpr ForkSide(pid_t _pid) noexcept
		:pid(_pid) {}

	constexpr bool IsChild() const noexcept {
		return pid == 0;
	}

	constexpr pid_t GetChildPid() const noexcept {
		assert(!IsChild());

		return pid;
	}
};

/**
 * Wrapper for fork().  Only the calling thread exists in the new
 * process.  The child must leave with _exit(), never by returning
 * to the caller's caller.
 *
 * Throws #ForkFailed on error.
 */
ForkSide
Fork();

} // namespace ForkMap
