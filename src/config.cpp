#include "config.hpp"

namespace executor {
using namespace std;

string DOCKER_HOST = "/var/run/docker.sock";
string DOCKER_API_VERSION = "v1.41";
filesystem::path WORKSPACE_DIR = filesystem::temp_directory_path() / "executor";
int MEMORY_LIMIT = 512;     // 512M
int CPU_PERIOD = 100000;    // 100ms
int CPU_QUOTA = 50000;      // 50ms
int WORKER_THREADS = 4;
int DEFAULT_TIMEOUT = 30;   // 30s
bool PULL_IMAGES = false;
bool PROVISION_TOOLCHAINS = false;
bool DEBUG = false;

}  // namespace executor
