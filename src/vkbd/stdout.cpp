/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
/* Build with -DREMAPD_VKBD=stdout. */

#include <stdio.h>

#include "../vkbd.h"
#include "../keys.h"

struct vkbd {};

std::shared_ptr<vkbd> vkbd_init(const char *)
{
	return std::make_shared<vkbd>();
}

void vkbd_send_key(struct vkbd*, uint16_t code, int state)
{
	printf("key: %s, state: %d\n", KEY_NAME(code), state);
}

void vkbd_flush(struct vkbd*)
{
	fflush(stdout);
}
