// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Channel.hxx"
#include "Payload.hxx"

#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

namespace ForkMap {

struct ForkOptions;

void
ApplyForkOptions(const ForkOptions &options) noexcept;

/**
 * Write the payload to the pipe, close it and terminate the process
 * with _exit(), skipping atexit handlers, static destructors and
 * stdio flushing.  The exit status is 0 unless the payload could
 * not be written completely.
 */
[[noreturn]]
void
ExitChild(UniqueFileDescriptor &&pipe_w, std::string_view payload) noexcept;

/**
 * The child side of ForkMap::Run(): invoke the computation, encode
 * its outcome and send it to the parent.  Never returns.
 */
template<typename F>
[[noreturn]]
void
RunChild(ResultChannel &&channel, const ForkOptions &options, F &f) noexcept
{
	channel.r.Close();

	ApplyForkOptions(options);

	std::string payload;

	try {
		if constexpr (std::is_void_v<std::invoke_result_t<F &>>) {
			std::invoke(f);
			payload = EncodeSuccessJson(nullptr);
		} else
			payload = EncodeSuccess(std::invoke(f));
	} catch (...) {
		payload = EncodeError(std::current_exception());
	}

	ExitChild(std::move(channel.w), payload);
}

} // namespace ForkMap
