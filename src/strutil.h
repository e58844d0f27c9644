/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef STRUTIL_H
#define STRUTIL_H

#include <stddef.h>

#include <algorithm>
#include <string_view>

/*
 * The fields of a string separated by Ch, in order. An empty string
 * yields one empty field, a trailing separator an empty last field.
 */
template <char Ch>
struct split_view {
	std::string_view str;

	struct iterator {
		std::string_view rest;
		bool done;

		constexpr std::string_view operator*() const
		{
			return rest.substr(0, rest.find(Ch));
		}

		constexpr iterator& operator++()
		{
			size_t pos = rest.find(Ch);
			if (pos == std::string_view::npos)
				done = true;
			else
				rest.remove_prefix(pos + 1);

			return *this;
		}

		constexpr bool operator!=(const iterator& rhs) const
		{
			return done != rhs.done;
		}
	};

	constexpr iterator begin() const { return {str, false}; }
	constexpr iterator end() const { return {{}, true}; }
};

template <char Ch>
constexpr split_view<Ch> split_char(std::string_view str)
{
	return {str};
}

#define C_SPACES " \t\r"

/* Strip leading and trailing spaces. */
constexpr std::string_view trim(std::string_view s)
{
	s.remove_prefix(std::min(s.size(), s.find_first_not_of(C_SPACES)));
	return s.substr(0, s.find_last_not_of(C_SPACES) + 1);
}

#endif
