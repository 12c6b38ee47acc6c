#include "config.hpp"

namespace runexec {
using namespace std;

double WALLTIME_BACKSTOP_OVERHEAD = 30;  // 30s
double MONITOR_MAX_INTERVAL = 1;         // 1s
double MONITOR_MIN_INTERVAL = 0.01;      // 10ms

string CGROUP_PREFIX = "runexec";
bool DEBUG = false;

}  // namespace runexec
