#include "model/solution.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

double grading_output::overall_score() const {
    if (solution_grades.empty()) return 0;
    double sum = 0;
    for (auto &grade : solution_grades)
        sum += grade.score;
    return sum / solution_grades.size();
}

void from_json(const json &j, llm_solution &solution) {
    j.at("problem_identifier").get_to(solution.problem_identifier);
    j.at("model_identifier").get_to(solution.model_identifier);
    j.at("prompt_identifier").get_to(solution.prompt_identifier);
    j.at("solution_code").get_to(solution.solution_code);
    if (j.count("feedback") && !j.at("feedback").is_null())
        solution.feedback = j.at("feedback");
}

void to_json(json &j, const llm_solution &solution) {
    j = {{"problem_identifier", solution.problem_identifier},
         {"model_identifier", solution.model_identifier},
         {"prompt_identifier", solution.prompt_identifier},
         {"solution_code", solution.solution_code},
         {"feedback", solution.feedback ? *solution.feedback : json()}};
}

void from_json(const json &j, solution_grade &grade) {
    j.at("problem_identifier").get_to(grade.problem_identifier);
    j.at("prompt_identifier").get_to(grade.prompt_identifier);
    j.at("model_identifier").get_to(grade.model_identifier);
    j.at("score").get_to(grade.score);
    if (j.count("sub_criteria_scores") && !j.at("sub_criteria_scores").is_null())
        grade.sub_criteria_scores = j.at("sub_criteria_scores");
    if (j.count("issues"))
        j.at("issues").get_to(grade.issues);
}

void to_json(json &j, const solution_grade &grade) {
    j = {{"problem_identifier", grade.problem_identifier},
         {"prompt_identifier", grade.prompt_identifier},
         {"model_identifier", grade.model_identifier},
         {"score", grade.score},
         {"sub_criteria_scores", grade.sub_criteria_scores ? *grade.sub_criteria_scores : json()},
         {"issues", grade.issues}};
}

void from_json(const json &j, grading_output &output) {
    j.at("grader_identifier").get_to(output.grader_identifier);
    j.at("solution_grades").get_to(output.solution_grades);
}

void to_json(json &j, const grading_output &output) {
    j = {{"grader_identifier", output.grader_identifier},
         {"solution_grades", output.solution_grades},
         {"overall_score", output.overall_score()}};
}

}  // namespace codebench
