// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "forkmap/Error.hxx"

#include <gtest/gtest.h>

#include <string>

#include <errno.h>
#include <signal.h>
#include <string.h>

using namespace ForkMap;

/* build raw wait statuses the way Linux encodes them */
static constexpr int
ExitedStatus(int code) noexcept
{
	return (code & 0xff) << 8;
}

static constexpr int
SignaledStatus(int signo, bool core=false) noexcept
{
	return signo | (core ? 0x80 : 0);
}

TEST(ForkMapError, ExitStatus)
{
	const ChildProcessFailed e{ExitedStatus(3)};
	EXPECT_EQ(e.GetStatus(), 0x300);
	EXPECT_FALSE(e.IsSignaled());
	EXPECT_EQ(e.GetExitStatus(), 3);
	EXPECT_STREQ(e.what(), "Child process exited with status 3");
}

TEST(ForkMapError, Signal)
{
	const ChildProcessFailed e{SignaledStatus(SIGKILL)};
	EXPECT_TRUE(e.IsSignaled());
	EXPECT_EQ(e.GetTermSignal(), SIGKILL);
	EXPECT_EQ(std::string{e.what()},
		  std::string{"Child process was killed by signal 9 ("} + strsignal(SIGKILL) + ")");

	const ChildProcessFailed core{SignaledStatus(SIGSEGV, true)};
	EXPECT_TRUE(core.IsSignaled());
	EXPECT_EQ(core.GetTermSignal(), SIGSEGV);
	EXPECT_TRUE(std::string{core.what()}.ends_with(", core dumped"));
}

TEST(ForkMapError, SystemCall)
{
	const std::error_code code{EMFILE, std::system_category()};

	const ChannelSetupFailed channel{code};
	EXPECT_EQ(channel.GetCode(), code);
	EXPECT_EQ(std::string{channel.what()},
		  "Failed to create the result pipe: " + code.message());

	const ForkFailed fork{std::error_code{EAGAIN, std::system_category()}};
	EXPECT_EQ(fork.GetCode().value(), EAGAIN);

	const IoError io{"Failed to read", std::error_code{EIO, std::system_category()}};
	EXPECT_EQ(io.GetCode().value(), EIO);
	EXPECT_TRUE(std::string{io.what()}.starts_with("Failed to read: "));
}

TEST(ForkMapError, Hierarchy)
{
	/* every variant can be caught as ForkMap::Error */
	EXPECT_THROW(throw ChannelSetupFailed{std::error_code{}}, Error);
	EXPECT_THROW(throw ForkFailed{std::error_code{}}, Error);
	EXPECT_THROW(throw IoError("x", std::error_code{}), Error);
	EXPECT_THROW(throw ChildProcessFailed{ExitedStatus(1)}, Error);
	EXPECT_THROW(throw PayloadCorrupted{"x"}, Error);
	EXPECT_THROW(throw ComputationError{"x"}, Error);

	EXPECT_STREQ(ComputationError{"boom"}.what(), "boom");
}
