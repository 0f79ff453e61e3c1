// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "io/UniqueFileDescriptor.hxx"

namespace ForkMap {

/**
 * The pipe which transports the payload from the child to the
 * parent.  After fork(), the child closes #r and the parent closes
 * #w.
 */
struct ResultChannel {
	UniqueFileDescriptor r, w;
};

/**
 * Throws #ChannelSetupFailed on error.
 */
ResultChannel
OpenChannel();

} // namespace ForkMap
