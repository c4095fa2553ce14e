#include "marshal/marshaler.hpp"
#include "common/exceptions.hpp"
#include "marshal/literal_parser.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <regex>

namespace codebench {
using namespace std;
using namespace nlohmann;

static const regex optional_type(R"(^Optional\[(.*)\]$)");

static string strip_quotes(const string &s) {
    if (s.empty()) return s;
    char first = s.front(), last = s.back();
    if ((first == '\'' || first == '"') && first == last)
        return s.size() >= 2 ? s.substr(1, s.size() - 2) : "";
    return s;
}

static json to_int(const json &input) {
    switch (input.type()) {
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return input;
        case json::value_t::boolean:
            return input.get<bool>() ? 1 : 0;
        case json::value_t::number_float: {
            double value = trunc(input.get<double>());
            if (!isfinite(value) || value < -9.2e18 || value > 9.2e18)
                throw marshaling_error(fmt::format("cannot convert float {} to int", to_literal(input)));
            return (int64_t)value;
        }
        case json::value_t::string: {
            string text = boost::trim_copy(input.get<string>());
            boost::erase_all(text, "_");
            try {
                return boost::lexical_cast<int64_t>(text);
            } catch (boost::bad_lexical_cast &) {
                throw marshaling_error(fmt::format("invalid literal for int(): '{}'", input.get<string>()));
            }
        }
        default:
            throw marshaling_error(fmt::format("int() argument must be a string or a number, not '{}'", python_type_name(input)));
    }
}

static json to_float(const json &input) {
    switch (input.type()) {
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return input.get<double>();
        case json::value_t::boolean:
            return input.get<bool>() ? 1.0 : 0.0;
        case json::value_t::string: {
            string text = boost::trim_copy(input.get<string>());
            try {
                return boost::lexical_cast<double>(text);
            } catch (boost::bad_lexical_cast &) {
                throw marshaling_error(fmt::format("could not convert string to float: '{}'", input.get<string>()));
            }
        }
        default:
            throw marshaling_error(fmt::format("float() argument must be a string or a number, not '{}'", python_type_name(input)));
    }
}

static json to_bool(const json &input) {
    return boost::to_lower_copy(to_display(input)) == "true";
}

json coerce(const string &declared_type, const json &literal) {
    string type = declared_type;
    smatch match;
    if (regex_match(declared_type, match, optional_type))
        type = match[1].str();

    if (literal.is_null())
        return nullptr;

    json input = literal;
    if (input.is_string())
        input = strip_quotes(input.get<string>());

    if (type == "int") {
        return to_int(input);
    } else if (type == "float") {
        return to_float(input);
    } else if (type == "str") {
        return decode_string_escapes(to_display(input));
    } else if (type == "bool") {
        return to_bool(input);
    } else if (type.find('[') != string::npos && input.is_string()) {
        return parse_python_literal(input.get<string>());
    } else {
        return input;
    }
}

json parameter_values(const function_prototype &prototype, const test_case &tc) {
    json values = json::object();
    for (auto &param : prototype.parameters) {
        if (!tc.parameters.is_object() || !tc.parameters.contains(param.name))
            throw missing_parameter_error(param.name);
        values[param.name] = coerce(param.type, tc.parameters.at(param.name));
    }
    return values;
}

json ordered_arguments(const function_prototype &prototype, const test_case &tc) {
    json values = parameter_values(prototype, tc);
    json arguments = json::array();
    for (auto &param : prototype.parameters)
        arguments.push_back(values.at(param.name));
    return arguments;
}

json expected_return(const function_prototype &prototype, const test_case &tc) {
    json expected = tc.expected_output.is_array() ? tc.expected_output : json::array({tc.expected_output});
    json converted = json::array();
    for (size_t i = 0; i < prototype.return_values.size() && i < expected.size(); ++i)
        converted.push_back(coerce(prototype.return_values[i].type, expected[i]));
    if (converted.size() == 1)
        return converted[0];
    return converted;
}

}  // namespace codebench
