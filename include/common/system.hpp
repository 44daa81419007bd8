#pragma once

namespace codegrade {

/**
 * @brief Resolve a user name to its uid.
 * @return the uid, or -1 when no such user exists
 */
int get_userid(const char *name);

/**
 * @brief Resolve a group name to its gid.
 * @return the gid, or -1 when no such group exists
 */
int get_groupid(const char *name);

}  // namespace codegrade
