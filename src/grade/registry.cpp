#include "grade/registry.hpp"
#include "common/exceptions.hpp"
#include "grade/code_coverage.hpp"
#include "grade/code_reuse.hpp"
#include "grade/correctness.hpp"
#include "grade/memory.hpp"
#include "grade/performance.hpp"
#include "grade/static_analysis.hpp"
#include <glog/logging.h>
#include <map>

namespace codebench {
using namespace std;

static map<string, unique_ptr<grader>> graders;

void register_grader(unique_ptr<grader> &&instance) {
    string name = instance->identifier();
    graders[name] = move(instance);
}

void register_builtin_graders() {
    register_grader(make_unique<correctness_grader>());
    register_grader(make_unique<performance_grader>());
    register_grader(make_unique<memory_grader>());
    register_grader(make_unique<halstead_grader>());
    register_grader(make_unique<code_coverage_grader>());
    register_grader(make_unique<human_likeness_grader>());
    register_grader(make_unique<coding_convention_grader>());
    register_grader(make_unique<code_reuse_grader>());
}

vector<grader *> resolve_graders(const vector<string> &names) {
    vector<grader *> result;
    for (auto &name : names) {
        auto it = graders.find(name);
        if (it == graders.end()) {
            LOG(WARNING) << "Unknown grader " << name << ", using correctness instead";
            it = graders.find("correctness");
            if (it == graders.end())
                throw internal_error("correctness grader is not registered");
        }
        result.push_back(it->second.get());
    }
    return result;
}

vector<string> all_graders() {
    vector<string> names;
    for (auto &[name, instance] : graders)
        names.push_back(name);
    return names;
}

}  // namespace codebench
