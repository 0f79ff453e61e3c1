// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <cstddef>
#include <exception>
#include <string>

#include <sys/types.h>

namespace ForkMap {

/**
 * The parent side of ForkMap::Run(): owns the child's pid and the
 * read end of the result pipe until the child has been reaped.
 */
class ChildProcess {
	pid_t pid;

	UniqueFileDescriptor pipe_r;

	enum class State {
		/**
		 * The child has not been reaped yet.
		 */
		AWAITING,

		/**
		 * The child has been reaped (or waitpid() has failed
		 * for good).
		 */
		DONE,
	} state = State::AWAITING;

public:
	/**
	 * The size of one read() from the result pipe.
	 */
	static constexpr std::size_t CHUNK_SIZE = 4096;

	ChildProcess(pid_t _pid, UniqueFileDescriptor &&_pipe_r) noexcept;

	/**
	 * If the child has not been reaped yet, close the pipe (so a
	 * blocked writer gets EPIPE) and wait for it.
	 */
	~ChildProcess() noexcept;

	ChildProcess(const ChildProcess &) = delete;
	ChildProcess &operator=(const ChildProcess &) = delete;

	pid_t GetPid() const noexcept {
		return pid;
	}

	bool IsDone() const noexcept {
		return state == State::DONE;
	}

	/**
	 * Read the payload until the child closes the pipe, then
	 * wait for the child to exit.  May be called only once.
	 *
	 * Throws #IoError if reading or waiting fails and
	 * #ChildProcessFailed if the exit status is not 0.
	 *
	 * @return the undecoded payload
	 */
	std::string Collect();

	/**
	 * Log (at level 2) that the payload returned by Collect()
	 * could not be decoded.
	 */
	void LogCorruptedPayload(std::size_t size,
				 const std::exception &error) const;

private:
	std::string ReadPayload();

	/**
	 * @return the raw wait status
	 */
	int Wait();
};

} // namespace ForkMap
