// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>

#include <sys/types.h> // for ssize_t

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	constexpr int Steal() noexcept {
		int _fd = fd;
		fd = -1;
		return _fd;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	/**
	 * Open a file.  Returns false on error (errno is set).
	 */
	bool Open(const char *pathname, int flags,
		  mode_t mode=0666) noexcept;

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 */
	bool Close() noexcept;

	[[nodiscard]]
	ssize_t Read(std::span<std::byte> dest) const noexcept;

	[[nodiscard]]
	ssize_t Write(std::span<const std::byte> src) const noexcept;

	/**
	 * Write all bytes, retrying after short writes and EINTR.
	 *
	 * Throws on error.
	 */
	void FullWrite(std::span<const std::byte> src) const;
};
