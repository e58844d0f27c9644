/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef VIRTUAL_KEYBOARD_H
#define VIRTUAL_KEYBOARD_H

#include <stdint.h>
#include <memory>

#define VKBD_NAME "remapd virtual keyboard"

struct vkbd;

/* Dies if the output device cannot be created. */
std::shared_ptr<vkbd> vkbd_init(const char *name);

/* state: 0 = up, 1 = down, 2 = autorepeat */
void vkbd_send_key(struct vkbd* vkbd, uint16_t code, int state);
void vkbd_flush(struct vkbd* vkbd);
#endif
