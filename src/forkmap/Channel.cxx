// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Channel.hxx"
#include "Error.hxx"
#include "io/Pipe.hxx"

namespace ForkMap {

ResultChannel
OpenChannel()
try {
	auto [r, w] = CreatePipe();
	return {std::move(r), std::move(w)};
} catch (const std::system_error &e) {
	throw ChannelSetupFailed{e.code()};
}

} // namespace ForkMap
