#pragma once

#include "runguard_options.hpp"

/**
 * @brief Run a command under the given restrictions and wait for it.
 * Safe to call from several threads at once: every call owns its pipes,
 * child process and control group.
 *
 * 1. Resolve the command in PATH, create the control group when one is
 *    requested, and create close-on-exec pipes for stdin, stdout, stderr.
 * 2. Fork. The child waits until the watchdog has moved it into the control
 *    group, then calls set_restrictions (process group, namespaces,
 *    rlimits, user, working directory), redirects its standard streams
 *    and execs the command. A failure before exec is written back through
 *    a pipe and reported as internal_error.
 * 3. The watchdog feeds stdin, collects stdout and stderr up to stream_size
 *    bytes each (the rest is read and discarded), polls the child with
 *    wait4 and kills the whole process group when the hard wall time
 *    limit passes or should_abort returns true.
 * 4. After the command ended, every remaining process of the run is
 *    killed, usage is read from rusage or the control group, and the
 *    control group is deleted.
 *
 * @return what happened to the command
 * @throw std::system_error, cgroup_exception when the watchdog itself fails,
 * the child has been killed and reaped before the exception leaves
 */
runguard_result runit(const struct runguard_options &opt);
