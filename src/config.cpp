#include "config.hpp"

namespace bayview {
using namespace std;

filesystem::path RUN_DIR;
int COMPILE_TIME_LIMIT = 0;  // unlimited
compare_mode COMPARE_MODE = compare_mode::COLLAPSE;
size_t STDERR_LIMIT = 1 << 16;  // 64K
size_t OUTPUT_LIMIT = 256 << 20;  // 256M
int KILL_GRACE_MS = 1000;

}  // namespace bayview
