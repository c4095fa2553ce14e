#include "config.hpp"

namespace codebench {
using namespace std;

double EXECUTION_TIME_LIMIT = 5;               // 5s
double PERFORMANCE_STABILITY_THRESHOLD = 0.4;  // 0.4s
int PERFORMANCE_SCALE_FACTOR = 10;
long PERFORMANCE_MAX_ITERATIONS = 100000000;
int MEMORY_ITERATIONS = 10;
double STYLE_PENALTY = 0.1;
int MAX_LINE_LENGTH = 79;

filesystem::path TEMP_DIR = filesystem::temp_directory_path();
bool DEBUG = false;

}  // namespace codebench
