// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Channel.hxx"
#include "Child.hxx"
#include "ChildProcess.hxx"
#include "Error.hxx"
#include "Fork.hxx"
#include "Options.hxx"
#include "Payload.hxx"

#include <concepts>
#include <type_traits>

namespace ForkMap {

/**
 * The type returned by a computation, and thus by Run().
 */
template<typename F>
using RunResult = std::remove_cvref_t<std::invoke_result_t<F &>>;

/**
 * Invoke the computation in a new child process created with fork()
 * and return its result.  This blocks until the child has exited.
 * Memory and global state modified by the computation are discarded
 * with the child.
 *
 * The computation reports failure by throwing; its message (see
 * GetFullMessage()) is rethrown in the parent as #ComputationError.
 *
 * This is dangerous: the child is a copy of this process in which
 * only the calling thread exists.  The computation must not depend
 * on other threads (e.g. on locks they may hold) and must not touch
 * file descriptors shared with the parent in a way that interferes
 * with it.  All file descriptors are inherited by the child.
 *
 * Throws #ChannelSetupFailed, #ForkFailed, #IoError,
 * #ChildProcessFailed, #PayloadCorrupted or #ComputationError.
 */
template<typename F>
requires std::invocable<F &> && Transportable<RunResult<F>>
RunResult<F>
Run(F &&f, const ForkOptions &options={})
{
	auto channel = OpenChannel();

	const auto side = Fork();
	if (side.IsChild())
		RunChild(std::move(channel), options, f);

	channel.w.Close();

	ChildProcess child{side.GetChildPid(), std::move(channel.r)};
	const auto payload = child.Collect();

	try {
		return DecodeOutcome<RunResult<F>>(payload);
	} catch (const PayloadCorrupted &e) {
		child.LogCorruptedPayload(payload.size(), e);
		throw;
	}
}

} // namespace ForkMap
