/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */
#ifndef CONFIG_H
#define CONFIG_H

#include <string_view>

#include "ruleset.h"

#define MAX_INCLUDE_DEPTH 10

/*
 * Read a ruleset from an INI style file into *rs. Every bad line is
 * reported; the first error is returned. The result still needs
 * ruleset_finalize().
 */
rs_error config_parse(ruleset *rs, const char *path);

/* As config_parse, but from memory. name is used in messages and to resolve includes. */
rs_error config_parse_string(ruleset *rs, std::string_view text, const char *name = "<string>");

/* Add a single "key = action" entry to the given section. */
rs_error config_add_entry(ruleset *rs, std::string_view section, std::string_view exp);

#endif
