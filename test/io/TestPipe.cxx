// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "io/Pipe.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>
#include <span>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <signal.h>

using std::string_view_literals::operator""sv;

TEST(Pipe, CloseOnExec)
{
	const auto [r, w] = CreatePipe();
	ASSERT_TRUE(r.IsDefined());
	ASSERT_TRUE(w.IsDefined());

	EXPECT_TRUE(fcntl(r.Get(), F_GETFD) & FD_CLOEXEC);
	EXPECT_TRUE(fcntl(w.Get(), F_GETFD) & FD_CLOEXEC);
}

TEST(Pipe, FullWriteAndEndOfFile)
{
	auto [r, w] = CreatePipe();

	w.FullWrite(AsBytes("hello world"sv));
	w.Close();
	EXPECT_FALSE(w.IsDefined());

	std::string received;
	std::array<std::byte, 4> buffer;
	ssize_t nbytes;
	while ((nbytes = r.Read(buffer)) > 0)
		received.append(ToStringView(std::span{buffer}.first(std::size_t(nbytes))));

	EXPECT_EQ(nbytes, 0);
	EXPECT_EQ(received, "hello world");
}

TEST(Pipe, MoveTransfersOwnership)
{
	auto [r, w] = CreatePipe();
	const int fd = r.Get();

	UniqueFileDescriptor other{std::move(r)};
	EXPECT_FALSE(r.IsDefined());
	EXPECT_EQ(other.Get(), fd);

	const FileDescriptor released = other.Release();
	EXPECT_FALSE(other.IsDefined());
	EXPECT_EQ(released.Get(), fd);

	UniqueFileDescriptor closer{released};
}

TEST(Pipe, WriteToClosedPipe)
{
	auto [r, w] = CreatePipe();
	r.Close();

	/* ignore SIGPIPE so the write fails with EPIPE */
	signal(SIGPIPE, SIG_IGN);
	EXPECT_THROW(w.FullWrite(AsBytes("x"sv)), std::system_error);
	signal(SIGPIPE, SIG_DFL);
}
