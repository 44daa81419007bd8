#include "config.hpp"

namespace codegrade {
using namespace std;

filesystem::path RUN_DIR;
double COMPILE_TIME_LIMIT = 10;           // 10s
int64_t COMPILE_MEMORY_LIMIT = 512;       // 512M
double MAX_TIME_LIMIT = 60;               // 60s
int64_t MAX_MEMORY_LIMIT = 0;             // physical memory
int64_t OUTPUT_LIMIT = 1 << 20;           // 1M
int64_t DIAGNOSTIC_LIMIT = 1 << 14;       // 16K
int64_t FILE_LIMIT = 1 << 26;             // 64M
double WALL_GRACE = 1;                    // 1s
bool USE_CGROUP = false;
int RUN_USER_ID = -1;
int RUN_GROUP_ID = -1;
bool DEBUG = false;

}  // namespace codegrade
