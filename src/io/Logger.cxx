// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"

#include <algorithm>
#include <array>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

static struct iovec
MakeIovec(std::string_view s) noexcept
{
	return {const_cast<char *>(s.data()), s.size()};
}

void
LoggerDetail::WriteV(std::string_view domain,
		     std::initializer_list<std::string_view> buffers) noexcept
{
	std::array<struct iovec, 16> v;
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec("[");
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] ");
	}

	for (const auto i : buffers) {
		if (n >= v.size() - 1)
			break;

		v[n++] = MakeIovec(i);
	}

	v[n++] = MakeIovec("\n");

	[[maybe_unused]]
	ssize_t nbytes = writev(STDERR_FILENO, v.data(), n);
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	/* messages longer than the buffer are truncated */
	std::array<char, 1024> buffer;
	const auto result = fmt::vformat_to_n(buffer.data(), buffer.size(),
					      format_str, args);

	const std::size_t length = std::min<std::size_t>(result.size,
							 buffer.size());
	WriteV(domain, {std::string_view{buffer.data(), length}});
}
