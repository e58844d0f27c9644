/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef LAYER_STACK_H
#define LAYER_STACK_H

#include <stdint.h>
#include <stddef.h>
#include <array>

#define MAX_LAYERS 64

/* Active layer ids in activation order, most recent last. */
struct layer_snapshot {
	std::array<uint16_t, MAX_LAYERS> ids;
	uint8_t n = 0;

	size_t size() const { return n; }
	bool empty() const { return n == 0; }
	uint16_t operator[](size_t i) const { return ids[i]; }
	const uint16_t* begin() const { return ids.data(); }
	const uint16_t* end() const { return ids.data() + n; }

	bool operator==(const layer_snapshot& rhs) const
	{
		for (size_t i = 0; i < n; i++) {
			if (i >= rhs.n || ids[i] != rhs.ids[i])
				return false;
		}
		return n == rhs.n;
	}
};

/*
 * Set of active layers for one device. Layer 0 is the base table and is
 * never part of the stack. Activation and deactivation are idempotent and
 * report whether the set changed.
 */
struct layer_stack {
	bool activate(uint16_t id);
	bool deactivate(uint16_t id);
	bool active(uint16_t id) const;
	void clear() { state.n = 0; }

	const layer_snapshot& snapshot() const { return state; }

	size_t size() const { return state.n; }
	bool empty() const { return state.n == 0; }
	uint16_t operator[](size_t i) const { return state.ids[i]; }
private:
	layer_snapshot state;
};

#endif
