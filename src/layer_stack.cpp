/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <algorithm>

#include "layer_stack.h"

bool layer_stack::active(uint16_t id) const
{
	return std::find(state.begin(), state.end(), id) != state.end();
}

bool layer_stack::activate(uint16_t id)
{
	if (!id || active(id))
		return false;

	if (state.n == state.ids.size())
		return false;

	state.ids[state.n++] = id;
	return true;
}

bool layer_stack::deactivate(uint16_t id)
{
	auto it = std::find(state.ids.begin(), state.ids.begin() + state.n, id);
	if (it == state.ids.begin() + state.n)
		return false;

	std::copy(it + 1, state.ids.begin() + state.n, it);
	state.n--;
	return true;
}
