#include "grade/static_analysis.hpp"
#include "config.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <regex>
#include <set>

namespace codebench {
using namespace std;

static vector<string> split_lines(const string &code) {
    vector<string> lines;
    boost::split(lines, code, boost::is_any_of("\n"));
    return lines;
}

static size_t code_points(const string &line) {
    return count_if(line.begin(), line.end(), [](char c) { return (c & 0xC0) != 0x80; });
}

static const regex multiple_blank_lines(R"(\n\s*\n\s*\n)");
static const regex space_before_punctuation(R"(\s[,;:])");
static const regex function_or_variable(R"(def (\w+)|(\w+) =)");
static const regex snake_case(R"(^[a-z_][a-z0-9_]*$)");
static const regex class_definition(R"(class (\w+))");
static const regex pascal_case(R"(^[A-Z][a-zA-Z0-9]*$)");
static const regex import_statement(R"(^import (\w+))");
static const regex wildcard_import(R"(^from .+ import \*)");
static const regex missing_operator_space(R"(=\w|==\w|\+\w|-\w|\*\w|/\w)");

string coding_convention_grader::identifier() const {
    return "coding_convention";
}

vector<string> coding_convention_grader::check(const string &code) {
    vector<string> issues;
    vector<string> lines = split_lines(code);

    for (size_t i = 0; i < lines.size(); ++i)
        if (code_points(lines[i]) > (size_t)MAX_LINE_LENGTH)
            issues.push_back(fmt::format("Line {} exceeds {} characters.", i + 1, MAX_LINE_LENGTH));

    if (regex_search(code, multiple_blank_lines))
        issues.push_back("Multiple blank lines found.");

    for (size_t i = 0; i < lines.size(); ++i)
        if (regex_search(lines[i], space_before_punctuation))
            issues.push_back(fmt::format("Space found before punctuation on line {}.", i + 1));

    for (sregex_iterator it(code.begin(), code.end(), function_or_variable), end; it != end; ++it) {
        string name = (*it)[1].matched ? (*it)[1].str() : (*it)[2].str();
        if (!regex_match(name, snake_case))
            issues.push_back(fmt::format("Invalid function or variable name '{}'.", name));
    }
    for (sregex_iterator it(code.begin(), code.end(), class_definition), end; it != end; ++it) {
        string name = (*it)[1].str();
        if (!regex_match(name, pascal_case))
            issues.push_back(fmt::format("Invalid class name '{}'.", name));
    }

    if (any_of(lines.begin(), lines.end(), [](const string &line) {
            return boost::starts_with(line, "    ") || boost::starts_with(line, "\t");
        }))
        issues.push_back("Inconsistent indentation found.");

    vector<string> imports;
    bool wildcard = false;
    for (auto &line : lines) {
        smatch match;
        if (regex_search(line, match, import_statement))
            imports.push_back(match[1].str());
        if (regex_search(line, wildcard_import))
            wildcard = true;
    }
    if (!is_sorted(imports.begin(), imports.end()))
        issues.push_back("Imports are not in alphabetical order.");
    if (wildcard)
        issues.push_back("Wildcard import found.");

    for (size_t i = 0; i < lines.size(); ++i)
        if (boost::ends_with(lines[i], " "))
            issues.push_back(fmt::format("Trailing whitespace found on line {}.", i + 1));

    for (size_t i = 0; i < lines.size(); ++i)
        if (regex_search(lines[i], missing_operator_space))
            issues.push_back(fmt::format("Missing space around operator on line {}.", i + 1));

    return issues;
}

solution_grade coding_convention_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    solution_grade grade = make_grade(problem, solution);
    grade.issues = check(solution.solution_code);
    grade.score = max(0.0, 1 - grade.issues.size() * STYLE_PENALTY);
    return grade;
}

static set<string> tokenize(const string &code) {
    vector<string> words;
    boost::split(words, code, boost::is_space(), boost::token_compress_on);
    set<string> tokens;
    for (auto &word : words)
        if (!word.empty()) tokens.insert(word);
    return tokens;
}

string human_likeness_grader::identifier() const {
    return "humanlikeness";
}

bool human_likeness_grader::can_grade(const vector<problem_definition> &problems) const {
    if (!grader::can_grade(problems)) return false;
    return all_of(problems.begin(), problems.end(), [](auto &problem) { return problem.optimal_solution.has_value(); });
}

double human_likeness_grader::jaccard_distance(const string &a, const string &b) {
    set<string> first = tokenize(a), second = tokenize(b);
    vector<string> common, all;
    set_intersection(first.begin(), first.end(), second.begin(), second.end(), back_inserter(common));
    set_union(first.begin(), first.end(), second.begin(), second.end(), back_inserter(all));
    if (all.empty()) return 0;
    return 1 - (double)common.size() / all.size();
}

solution_grade human_likeness_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    solution_grade grade = make_grade(problem, solution);
    grade.score = 1 - jaccard_distance(solution.solution_code, *problem.optimal_solution);
    return grade;
}

static const set<string> halstead_operators = {
    "+", "-", "*", "/", "%", "//", "**", "<<", ">>", "&", "|", "^", "~", "<", ">", "<=", ">=", "==", "!=",
    "and", "or", "not", "is", "in", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "<<=", ">>=", "//=", "**=",
    "(", ")", "[", "]", "{", "}", "@", ",", ":", ".", "=", "->", ";"};

string halstead_grader::identifier() const {
    return "halstead";
}

double halstead_grader::difficulty(const string &code) {
    string text = boost::replace_all_copy(boost::replace_all_copy(code, "\n", " "), "\t", " ");
    vector<string> words;
    boost::split(words, text, boost::is_any_of(" "));

    // 不包含任何运算符的单词视为操作数
    vector<string> operands;
    for (auto &word : words) {
        if (word.empty()) continue;
        bool has_operator = any_of(halstead_operators.begin(), halstead_operators.end(),
                                   [&](const string &op) { return word.find(op) != string::npos; });
        if (!has_operator) operands.push_back(word);
    }
    if (operands.empty()) return 0;

    set<string> unique_operators;
    for (auto &token : tokenize(code))
        if (halstead_operators.count(token)) unique_operators.insert(token);
    set<string> unique_operands(operands.begin(), operands.end());

    return (unique_operators.size() / 2.0) * ((double)operands.size() / unique_operands.size());
}

solution_grade halstead_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    solution_grade grade = make_grade(problem, solution);
    grade.score = difficulty(solution.solution_code);
    return grade;
}

}  // namespace codebench
