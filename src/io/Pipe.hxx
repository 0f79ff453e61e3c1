// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "UniqueFileDescriptor.hxx"

#include <utility>

/**
 * Wrapper for pipe2() with O_CLOEXEC.  Returns the read end and the
 * write end.
 *
 * Throws on error.
 */
std::pair<UniqueFileDescriptor, UniqueFileDescriptor>
CreatePipe();
