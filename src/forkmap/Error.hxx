// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace ForkMap {

/**
 * Base class for all errors thrown by ForkMap::Run().
 */
class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Base class for errors caused by a failed system call.
 */
class SystemCallError : public Error {
	std::error_code code;

public:
	SystemCallError(const char *msg, std::error_code _code);

	const std::error_code &GetCode() const noexcept {
		return code;
	}
};

/**
 * The result pipe could not be created.  No child process was
 * spawned.
 */
class ChannelSetupFailed final : public SystemCallError {
public:
	explicit ChannelSetupFailed(std::error_code _code)
		:SystemCallError("Failed to create the result pipe", _code) {}
};

/**
 * fork() failed.  No child process was spawned.
 */
class ForkFailed final : public SystemCallError {
public:
	explicit ForkFailed(std::error_code _code)
		:SystemCallError("fork() failed", _code) {}
};

/**
 * Reading the result pipe or waiting for the child process failed.
 */
class IoError final : public SystemCallError {
public:
	using SystemCallError::SystemCallError;
};

/**
 * The child process did not exit with status 0.  A payload it may
 * have written was discarded.
 */
class ChildProcessFailed final : public Error {
	int status;

public:
	/**
	 * @param _status the raw status obtained by waitpid()
	 */
	explicit ChildProcessFailed(int _status);

	int GetStatus() const noexcept {
		return status;
	}

	[[gnu::pure]]
	bool IsSignaled() const noexcept;

	/**
	 * The signal which killed the child; only valid if
	 * IsSignaled() returns true.
	 */
	[[gnu::pure]]
	int GetTermSignal() const noexcept;

	/**
	 * The exit code passed to exit(); only valid if IsSignaled()
	 * returns false.
	 */
	[[gnu::pure]]
	int GetExitStatus() const noexcept;
};

/**
 * The bytes received from the child could not be decoded.
 */
class PayloadCorrupted : public Error {
public:
	using Error::Error;
};

/**
 * The computation threw an exception inside the child process.
 * Only its message survives the process boundary; what() returns it
 * unmodified.
 */
class ComputationError final : public Error {
public:
	explicit ComputationError(const std::string &description)
		:Error(description) {}
};

} // namespace ForkMap
