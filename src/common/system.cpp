#include "common/system.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>

int get_userid(const char *name) {
    errno = 0;
    struct passwd *pwd = getpwnam(name);

    if (!pwd || errno) return -1;
    return (int)pwd->pw_uid;
}

int get_groupid(const char *name) {
    errno = 0;
    struct group *g = getgrnam(name);

    if (!g || errno) return -1;
    return (int)g->gr_gid;
}
