// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ProcessName.hxx"

#include <algorithm>
#include <array>

#include <sys/prctl.h>

/* TASK_COMM_LEN from linux/sched.h, including the null terminator */
static constexpr std::size_t TASK_COMM_LEN = 16;

void
SetProcessName(std::string_view name) noexcept
{
	std::array<char, TASK_COMM_LEN> buffer{};
	std::copy_n(name.begin(), std::min(name.size(), buffer.size() - 1),
		    buffer.begin());

	prctl(PR_SET_NAME, (unsigned long)buffer.data(), 0, 0, 0);
}
