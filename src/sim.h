/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef SIM_H
#define SIM_H

#include <stdint.h>
#include <string>
#include <string_view>

struct engine;

/*
 * Replay a transition script through the engine as device id. One entry
 * per line:
 *
 *	+<key> <ms>	key down
 *	-<key> <ms>	key up
 *	tick <ms>	timer tick
 *
 * Times are absolute. A line per entry is appended to out. Returns 0, or
 * -1 with errstr set on the first malformed line.
 */
int sim_run(engine& eng, uint32_t id, std::string_view script, std::string& out);

#endif
