#include "config.hpp"
#include "runner/classifier.hpp"

namespace sandbox {
using namespace std;

filesystem::path WORKSPACE_DIR;
filesystem::path SCRIPT_DIR;
filesystem::path LANGUAGE_CONFIG;
uint64_t STATS_LOG_EVERY = 200;
double STATS_LOG_SECONDS = 0;
string IMPORT_ERROR_PATTERN = DEFAULT_IMPORT_ERROR_PATTERN;
string POD_NAME;
unsigned WORKER_COUNT = 4;

}  // namespace sandbox
