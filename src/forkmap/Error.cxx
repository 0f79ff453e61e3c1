// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Error.hxx"

#include <fmt/core.h>

#include <string.h> // for strsignal()
#include <sys/wait.h>

namespace ForkMap {

SystemCallError::SystemCallError(const char *msg, std::error_code _code)
	:Error(fmt::format("{}: {}", msg, _code.message())),
	 code(_code) {}

static std::string
DescribeStatus(int status)
{
	if (WIFSIGNALED(status))
		return fmt::format("Child process was killed by signal {} ({}){}",
				   WTERMSIG(status), strsignal(WTERMSIG(status)),
				   WCOREDUMP(status) ? ", core dumped" : "");

	if (WIFEXITED(status))
		return fmt::format("Child process exited with status {}",
				   WEXITSTATUS(status));

	return fmt::format("Child process terminated abnormally (status {:#x})",
			   status);
}

ChildProcessFailed::ChildProcessFailed(int _status)
	:Error(DescribeStatus(_status)), status(_status) {}

bool
ChildProcessFailed::IsSignaled() const noexcept
{
	return WIFSIGNALED(status);
}

int
ChildProcessFailed::GetTermSignal() const noexcept
{
	return WTERMSIG(status);
}

int
ChildProcessFailed::GetExitStatus() const noexcept
{
	return WEXITSTATUS(status);
}

} // namespace ForkMap
