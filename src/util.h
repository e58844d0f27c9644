/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef UTIL_H
#define UTIL_H

#include <stdint.h>
#include <stdio.h>
#include <stddef.h>
#include <unistd.h>

void xwrite(int fd, const void *buf, size_t sz);

/* CLOCK_MONOTONIC in ms. */
int64_t get_time_ms();

// One-time file reader
struct file_reader
{
	explicit file_reader(int fd)
		: fd(fd)
	{
	}

	file_reader(const file_reader&) = delete;
	file_reader& operator=(const file_reader&) = delete;

	explicit operator bool() const noexcept
	{
		return fd >= 0;
	}

	// Read full file
	template <typename T, typename V = typename T::value_type, typename = typename T::allocator_type>
	operator T()
	{
		static_assert(sizeof(V) == 1);
		T result;
		size_t rd = 0;
		if (fd < 0) [[unlikely]]
			return result;
		while (true) {
			const size_t new_size = rd + 4096;
			result.resize(new_size, 0);
			const auto rv = read(this->fd, result.data() + rd, new_size - rd);
			result.resize(rv < 0 ? 0 : (rd += rv));
			if (rv <= 0)
				break;
		}
		return result;
	}

	~file_reader()
	{
		if (fd >= 0)
			close(fd);
	}
private:
	int fd;
};

#endif
