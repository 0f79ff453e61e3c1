// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor which owns it and closes
 * it automatically in the destructor.
 */
class UniqueFileDescriptor : protected FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(const UniqueFileDescriptor &) = delete;

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	/**
	 * Convert this object to its #FileDescriptor base type.  This
	 * is done explicitly to avoid accidental conversions.
	 */
	const FileDescriptor &ToFileDescriptor() const noexcept {
		return *this;
	}

	/**
	 * Release ownership; the caller is now responsible for
	 * closing the file descriptor.
	 */
	FileDescriptor Release() noexcept {
		return FileDescriptor{Steal()};
	}

	using FileDescriptor::IsDefined;
	using FileDescriptor::Get;
	using FileDescriptor::Open;
	using FileDescriptor::Close;
	using FileDescriptor::Read;
	using FileDescriptor::Write;
	using FileDescriptor::FullWrite;
};
