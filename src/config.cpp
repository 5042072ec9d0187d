#include "config.hpp"

namespace judged {
using namespace std;

const char *VERSION = "1.0.0";

filesystem::path RUNGUARD;
filesystem::path RUN_DIR;
filesystem::path TEST_CASE_DIR;
filesystem::path SPJ_DIR;
string RUN_USER = "nobody";
string RUN_GROUP = "nogroup";
string TOKEN_DIGEST;

int64_t MAX_CPU_TIME_CEILING = 10000;                // 10s
int64_t MAX_MEMORY_CEILING = 1024LL * 1024 * 1024;   // 1G
int64_t MAX_COMPILE_CPU_TIME_CEILING = 10000;        // 10s
int64_t MAX_COMPILE_REAL_TIME_CEILING = 30000;       // 30s
int64_t MAX_COMPILE_MEMORY_CEILING = 1024LL * 1024 * 1024;
int REAL_TIME_FACTOR = 3;
int64_t OUTPUT_LIMIT = 16 * 1024 * 1024;             // 16M
int64_t COMPILE_OUTPUT_LIMIT = 64 * 1024;            // 64K
int64_t FILE_LIMIT = 16 * 1024 * 1024;
size_t PROCESS_LIMIT = 64;
int SPJ_TIME_FACTOR = 3;
int64_t SPJ_MEMORY_LIMIT = 1024LL * 1024 * 1024;
size_t SPJ_CACHE_SIZE = 64;
compare_mode COMPARE_MODE = compare_mode::IGNORE_TRAILING_SPACE;
bool DEBUG = false;

}  // namespace judged
