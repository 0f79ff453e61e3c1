// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Child.hxx"
#include "Options.hxx"
#include "io/WriteFile.hxx"
#include "system/ProcessName.hxx"
#include "util/SpanCast.hxx"

#include <stdlib.h>
#include <unistd.h>

namespace ForkMap {

void
ApplyForkOptions(const ForkOptions &options) noexcept
{
	if (options.process_name != nullptr)
		SetProcessName(options.process_name);

	if (options.oom_score_adj != nullptr)
		/* not fatal: the kernel may refuse lowering the value
		   without CAP_SYS_RESOURCE */
		TryWriteExistingFile("/proc/self/oom_score_adj",
				     options.oom_score_adj);
}

void
ExitChild(UniqueFileDescriptor &&pipe_w, std::string_view payload) noexcept
{
	try {
		pipe_w.FullWrite(AsBytes(payload));
	} catch (const std::exception &) {
		/* the parent would receive a truncated payload; let
		   it see a failed child instead */
		_exit(EXIT_FAILURE);
	}

	pipe_w.Close();
	_exit(EXIT_SUCCESS);
}

} // namespace ForkMap
