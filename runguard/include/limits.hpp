#pragma once

#include <sys/types.h>
#include "runguard_options.hpp"

/**
 * Steps of enter_namespaces and set_restrictions, reported to the watchdog when one of them fails.
 */
enum restriction_step {
    STEP_NONE = 0,
    STEP_SETSID,
    STEP_UNSHARE,
    STEP_RLIMIT,
    STEP_SETGID,
    STEP_SETUID,
    STEP_CHDIR,
    STEP_REDIRECT,
    STEP_EXEC,
    STEP_SYNC,
    STEP_FORK
};

const char *restriction_step_name(int step);

/**
 * Start a new session and unshare the namespaces asked for by opt.
 * A new PID namespace only applies to children forked afterwards,
 * the first of them becomes its init.
 *
 * @return STEP_NONE on success, otherwise the failed step with errno set
 */
int enter_namespaces(const struct runguard_options &opt);

/**
 * Limit the resources of the current process, called in the forked
 * child right before exec.
 *
 * Only async-signal-safe functions are used: the child of a multithreaded
 * process cannot allocate or log.
 *
 * @return STEP_NONE on success, otherwise the failed step with errno set
 */
int set_restrictions(const struct runguard_options &opt);
