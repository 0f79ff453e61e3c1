// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

namespace ForkMap {

/**
 * Settings applied by the child process before it invokes the
 * computation.
 */
struct ForkOptions {
	/**
	 * If set, then the child renames itself (prctl(PR_SET_NAME)).
	 */
	const char *process_name = nullptr;

	/**
	 * If set, then this string is written to
	 * /proc/self/oom_score_adj, e.g. "700" to let the OOM killer
	 * choose the child before the parent.  Errors are ignored.
	 */
	const char *oom_score_adj = nullptr;
};

} // namespace ForkMap
