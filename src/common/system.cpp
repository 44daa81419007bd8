#include "common/system.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <cstdlib>
#include <string>

namespace codegrade {

static bool parse_id(const char *name, int &id) {
    char *end = nullptr;
    long value = strtol(name, &end, 10);
    if (!*name || *end || value < 0) return false;
    id = (int)value;
    return true;
}

int get_userid(const char *name) {
    struct passwd pwd, *result = nullptr;
    char buf[4096];

    int id;
    if (parse_id(name, id)) return id;

    if (getpwnam_r(name, &pwd, buf, sizeof(buf), &result) != 0 || !result) return -1;
    return (int)pwd.pw_uid;
}

int get_groupid(const char *name) {
    struct group g, *result = nullptr;
    char buf[4096];

    int id;
    if (parse_id(name, id)) return id;

    if (getgrnam_r(name, &g, buf, sizeof(buf), &result) != 0 || !result) return -1;
    return (int)g.gr_gid;
}

}  // namespace codegrade
