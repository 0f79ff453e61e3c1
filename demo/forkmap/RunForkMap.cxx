// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Count lines, words and bytes of each file, each file in its own
 * child process.
 */

#include "forkmap/Parallel.hxx"
#include "io/Logger.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "system/Error.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cctype>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

struct Usage {};

struct FileStats {
	uint_least64_t lines = 0, words = 0, bytes = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileStats, lines, words, bytes)

static FileStats
CountFile(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_RDONLY)) {
		const int e = errno;
		throw MakeErrno(e, fmt::format("Failed to open '{}'", path).c_str());
	}

	FileStats stats;
	bool in_word = false;

	std::array<std::byte, 65536> buffer;
	while (true) {
		const ssize_t nbytes = fd.Read(buffer);
		if (nbytes < 0) {
			const int e = errno;
			throw MakeErrno(e, fmt::format("Failed to read '{}'", path).c_str());
		}

		if (nbytes == 0)
			break;

		stats.bytes += nbytes;

		for (const std::byte b : std::span{buffer}.first(std::size_t(nbytes))) {
			const auto ch = static_cast<unsigned char>(b);
			if (ch == '\n')
				++stats.lines;

			if (std::isspace(ch)) {
				in_word = false;
			} else if (!in_word) {
				in_word = true;
				++stats.words;
			}
		}
	}

	return stats;
}

int
main(int argc, char **argv)
try {
	std::span<const char *const> args{argv + 1, static_cast<std::size_t>(argc - 1)};

	unsigned jobs = 1;
	ForkMap::ForkOptions options;
	options.oom_score_adj = "700";

	while (!args.empty() && *args.front() == '-') {
		const std::string_view arg = args.front();
		args = args.subspan(1);

		if (arg == "--verbose"sv || arg == "-v"sv) {
			SetLogLevel(4);
		} else if (arg.starts_with("--jobs="sv)) {
			jobs = strtoul(arg.data() + 7, nullptr, 10);
			if (jobs == 0)
				throw Usage{};
		} else if (arg.starts_with("--name="sv)) {
			options.process_name = arg.data() + 7;
		} else
			throw Usage{};
	}

	if (args.empty())
		throw Usage{};

	const auto results = ForkMap::MapParallel(args, [](const char *path){
		return CountFile(path);
	}, jobs, options);

	for (std::size_t i = 0; i < results.size(); ++i)
		fmt::print("{:>8} {:>8} {:>8} {}\n",
			   results[i].lines, results[i].words,
			   results[i].bytes, args[i]);

	return EXIT_SUCCESS;
} catch (Usage) {
	fprintf(stderr, "Usage: RunForkMap"
		" [--verbose] [--jobs=N] [--name=NAME]"
		" FILE..."
		"\n");
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
