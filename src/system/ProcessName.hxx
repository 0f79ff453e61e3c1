// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string_view>

/**
 * Change the name of the calling thread as shown by ps and top
 * (prctl(PR_SET_NAME)).  The kernel keeps only the first 15
 * characters; longer names are truncated.
 */
void
SetProcessName(std::string_view name) noexcept;
