// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ChildProcess.hxx"
#include "Error.hxx"
#include "io/Logger.hxx"
#include "system/Error.hxx"
#include "util/Exception.hxx"
#include "util/SpanCast.hxx"

#include <array>
#include <cassert>
#include <span>

#include <sys/wait.h>

namespace ForkMap {

static const LLogger logger{"forkmap"};

static std::error_code
LastErrno() noexcept
{
	return std::error_code{errno, ErrnoCategory()};
}

ChildProcess::ChildProcess(pid_t _pid, UniqueFileDescriptor &&_pipe_r) noexcept
	:pid(_pid), pipe_r(std::move(_pipe_r))
{
	logger.Fmt(4, "Spawned child process {}", pid);
}

ChildProcess::~ChildProcess() noexcept
{
	if (state == State::DONE)
		return;

	logger.Fmt(4, "Reaping abandoned child process {}", pid);

	if (pipe_r.IsDefined())
		pipe_r.Close();

	int status;
	while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

std::string
ChildProcess::ReadPayload()
{
	std::string payload;
	std::array<std::byte, CHUNK_SIZE> buffer;

	while (true) {
		const ssize_t nbytes = pipe_r.Read(buffer);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw IoError{"Failed to read from the result pipe",
				      LastErrno()};
		}

		/* a short read does not mean the child is finished;
		   only end-of-file does */
		if (nbytes == 0)
			break;

		payload.append(ToStringView(std::span{buffer}.first(std::size_t(nbytes))));
	}

	return payload;
}

int
ChildProcess::Wait()
{
	assert(state == State::AWAITING);

	int status;
	while (waitpid(pid, &status, 0) < 0) {
		if (errno == EINTR)
			continue;

		const auto code = LastErrno();
		state = State::DONE;
		throw IoError{"waitpid() failed", code};
	}

	state = State::DONE;
	return status;
}

std::string
ChildProcess::Collect()
{
	assert(state == State::AWAITING);
	assert(pipe_r.IsDefined());

	auto payload = ReadPayload();
	pipe_r.Close();

	const int status = Wait();
	if (status != 0) {
		logger.Fmt(2, "Child process {} failed with status {:#x}; discarding {} payload bytes",
			   pid, status, payload.size());
		throw ChildProcessFailed{status};
	}

	logger.Fmt(4, "Child process {} exited, {} payload bytes",
		   pid, payload.size());
	return payload;
}

void
ChildProcess::LogCorruptedPayload(std::size_t size,
				  const std::exception &error) const
{
	logger.Fmt(2, "Child process {} sent a corrupted payload ({} bytes): {}",
		   pid, size, GetFullMessage(error));
}

} // namespace ForkMap
