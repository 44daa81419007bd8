#include "common/utils.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>

namespace codegrade {
using namespace std;

int exec_program(const map<string, string> &env, const char **argv) {
    pid_t pid;
    switch (pid = fork()) {
        case -1:
            throw system_error(errno, system_category(), "fork");
        case 0:
            // leave interrupt handling to the parent
            signal(SIGINT, SIG_IGN);
            signal(SIGPIPE, SIG_DFL);
            for (auto &[key, value] : env)
                setenv(key.c_str(), value.c_str(), true);
            execvp(argv[0], (char **)argv);
            _exit(127);
        default:
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "waitpid");
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string truncate_text(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    // do not split a multi-byte UTF-8 sequence
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + fmt::format("\n... ({} more bytes truncated)", text.size() - cut);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codegrade
