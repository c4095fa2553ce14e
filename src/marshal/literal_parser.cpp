#include "marshal/literal_parser.hpp"
#include "common/exceptions.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace codebench {
using namespace std;
using namespace nlohmann;

static void append_utf8(string &out, uint32_t cp) {
    if (cp < 0x80) {
        out += (char)cp;
    } else if (cp < 0x800) {
        out += (char)(0xC0 | (cp >> 6));
        out += (char)(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += (char)(0xE0 | (cp >> 12));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    } else {
        out += (char)(0xF0 | (cp >> 18));
        out += (char)(0x80 | ((cp >> 12) & 0x3F));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    }
}

static uint32_t read_hex(const string &text, size_t &i, size_t end, int count) {
    uint32_t cp = 0;
    for (int k = 0; k < count; ++k) {
        if (i + 1 >= end || !isxdigit((unsigned char)text[i + 1]))
            throw marshaling_error(fmt::format("truncated \\x, \\u or \\U escape in '{}'", text));
        char c = text[++i];
        cp = cp * 16 + (isdigit((unsigned char)c) ? c - '0' : tolower(c) - 'a' + 10);
    }
    return cp;
}

/**
 * @brief 解码 text[begin, end) 中的 Python 转义序列
 * 无法识别的转义序列原样保留反斜杠，与 Python 的行为一致
 */
static string decode_escapes(const string &text, size_t begin, size_t end) {
    string out;
    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (i + 1 >= end)
            throw marshaling_error(fmt::format("trailing backslash in string literal '{}'", text));
        char e = text[++i];
        switch (e) {
            case '\n': break;
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"': out += '"'; break;
            case 'a': out += '\a'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'v': out += '\v'; break;
            case 'x': append_utf8(out, read_hex(text, i, end, 2)); break;
            case 'u': append_utf8(out, read_hex(text, i, end, 4)); break;
            case 'U': {
                uint32_t cp = read_hex(text, i, end, 8);
                if (cp > 0x10FFFF)
                    throw marshaling_error(fmt::format("illegal Unicode character in '{}'", text));
                append_utf8(out, cp);
                break;
            }
            case 'N':
                throw marshaling_error("named unicode escapes are not supported");
            default:
                if (e >= '0' && e <= '7') {
                    uint32_t cp = e - '0';
                    for (int k = 0; k < 2 && i + 1 < end && text[i + 1] >= '0' && text[i + 1] <= '7'; ++k)
                        cp = cp * 8 + (text[++i] - '0');
                    append_utf8(out, cp);
                } else {
                    out += '\\';
                    out += e;
                }
        }
    }
    return out;
}

string decode_string_escapes(const string &text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\') {
            if (i + 1 >= text.size())
                throw marshaling_error(fmt::format("unterminated string literal \"{}\"", text));
            ++i;
        } else if (text[i] == '"' || text[i] == '\n') {
            throw marshaling_error(fmt::format("invalid string literal \"{}\"", text));
        }
    }
    return decode_escapes(text, 0, text.size());
}

string python_float_repr(double value) {
    if (isnan(value)) return "nan";
    if (isinf(value)) return value > 0 ? "inf" : "-inf";
    string s = fmt::format("{}", value);
    if (s.find_first_of(".en") == string::npos)
        s += ".0";
    return s;
}

/**
 * @brief 按 json.dumps 的规则将字典的键转为字符串
 */
static string dict_key(const json &key) {
    switch (key.type()) {
        case json::value_t::string: return key.get<string>();
        case json::value_t::boolean: return key.get<bool>() ? "true" : "false";
        case json::value_t::null: return "null";
        case json::value_t::number_integer: return to_string(key.get<int64_t>());
        case json::value_t::number_unsigned: return to_string(key.get<uint64_t>());
        case json::value_t::number_float: return python_float_repr(key.get<double>());
        default: throw marshaling_error(fmt::format("unsupported dict key {}", to_literal(key)));
    }
}

// 与 CPython 分词器的括号嵌套上限相同
static const int MAX_NESTING_DEPTH = 200;

class literal_parser {
public:
    explicit literal_parser(const string &text) : text(text), pos(0), depth(0) {}

    json parse() {
        json value = parse_expression();
        skip_whitespace();
        if (pos != text.size())
            fail("unexpected trailing characters");
        return value;
    }

private:
    const string &text;
    size_t pos;
    int depth;

    [[noreturn]] void fail(const string &reason) const {
        throw marshaling_error(fmt::format("malformed literal '{}' at position {}: {}", text, pos, reason));
    }

    void skip_whitespace() {
        while (pos < text.size() && isspace((unsigned char)text[pos])) ++pos;
    }

    char peek() {
        skip_whitespace();
        return pos < text.size() ? text[pos] : '\0';
    }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos;
        return true;
    }

    void expect(char c) {
        if (!consume(c)) fail(fmt::format("expected '{}'", c));
    }

    bool at_string_prefix() const {
        if (pos + 1 >= text.size()) return false;
        char c = text[pos], q = text[pos + 1];
        return (c == 'r' || c == 'R' || c == 'u' || c == 'U') && (q == '\'' || q == '"');
    }

    json parse_expression() {
        char c = peek();
        if (c == '[' || c == '(' || c == '{') {
            if (++depth > MAX_NESTING_DEPTH) fail("too many nested parentheses");
            json value = c == '[' ? parse_list() : c == '(' ? parse_parenthesized() : parse_braces();
            --depth;
            return value;
        }
        if (c == '-' || c == '+') return parse_signed();
        if (isdigit((unsigned char)c) || c == '.') return parse_number();
        if (c == '\'' || c == '"' || at_string_prefix()) return parse_strings();
        if (isalpha((unsigned char)c) || c == '_') return parse_name();
        fail("unexpected character");
    }

    json parse_list() {
        expect('[');
        return parse_elements(']', json::array());
    }

    json parse_elements(char close, json result) {
        while (!consume(close)) {
            result.push_back(parse_expression());
            if (consume(close)) break;
            expect(',');
        }
        return result;
    }

    json parse_parenthesized() {
        expect('(');
        if (consume(')')) return json::array();
        json first = parse_expression();
        if (consume(')')) return first;
        expect(',');
        json tuple = json::array();
        tuple.push_back(first);
        return parse_elements(')', tuple);
    }

    json parse_braces() {
        expect('{');
        if (consume('}')) return json::object();
        json first = parse_expression();
        if (!consume(':')) {
            json elements = json::array();
            elements.push_back(first);
            if (!consume('}')) {
                expect(',');
                elements = parse_elements('}', elements);
            }
            json set = json::array();
            for (auto &element : elements)
                if (find(set.begin(), set.end(), element) == set.end())
                    set.push_back(element);
            return set;
        }

        json dict = json::object();
        dict[dict_key(first)] = parse_expression();
        while (!consume('}')) {
            expect(',');
            if (consume('}')) break;
            json key = parse_expression();
            expect(':');
            dict[dict_key(key)] = parse_expression();
        }
        return dict;
    }

    json parse_signed() {
        bool negative = text[pos++] == '-';
        skip_whitespace();
        if (pos >= text.size() || !(isdigit((unsigned char)text[pos]) || text[pos] == '.'))
            fail("unary operator must be applied to a number");
        json value = parse_number();
        if (!negative) return value;
        if (value.is_number_float())
            return -value.get<double>();
        if (value.is_number_unsigned()) {
            uint64_t magnitude = value.get<uint64_t>();
            if (magnitude - 1 > (uint64_t)numeric_limits<int64_t>::max())
                fail("integer literal out of range");
            return (int64_t)(0 - magnitude);
        }
        return -value.get<int64_t>();
    }

    json parse_integer(size_t start, int base) {
        uint64_t value = 0;
        bool any = false;
        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '_') continue;
            int digit;
            if (isdigit((unsigned char)c)) digit = c - '0';
            else if (isalpha((unsigned char)c)) digit = tolower(c) - 'a' + 10;
            else break;
            if (digit >= base) fail("invalid digit in integer literal");
            if (value > (numeric_limits<uint64_t>::max() - digit) / base)
                fail("integer literal out of range");
            value = value * base + digit;
            any = true;
        }
        if (!any) fail(fmt::format("invalid integer literal '{}'", text.substr(start, pos - start)));
        if (value > (uint64_t)numeric_limits<int64_t>::max())
            return value;
        return (int64_t)value;
    }

    json parse_number() {
        size_t start = pos;
        if (text[pos] == '0' && pos + 1 < text.size()) {
            char prefix = tolower(text[pos + 1]);
            int base = prefix == 'x' ? 16 : prefix == 'o' ? 8 : prefix == 'b' ? 2 : 0;
            if (base) {
                pos += 2;
                json value = parse_integer(start, base);
                check_number_end();
                return value;
            }
        }

        bool is_float = false;
        string digits;
        auto read_digits = [&] {
            while (pos < text.size() && (isdigit((unsigned char)text[pos]) || text[pos] == '_')) {
                if (text[pos] != '_') digits += text[pos];
                ++pos;
            }
        };
        read_digits();
        if (pos < text.size() && text[pos] == '.') {
            is_float = true;
            digits += text[pos++];
            read_digits();
        }
        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            is_float = true;
            digits += text[pos++];
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
                digits += text[pos++];
            read_digits();
        }
        if (pos < text.size() && (text[pos] == 'j' || text[pos] == 'J'))
            fail("complex literals are not supported");
        check_number_end();

        if (is_float) {
            char *end = nullptr;
            double value = strtod(digits.c_str(), &end);
            if (digits == "." || end != digits.c_str() + digits.size())
                fail(fmt::format("invalid float literal '{}'", digits));
            return value;
        }
        if (digits.size() > 1 && digits[0] == '0' && digits.find_first_not_of('0') != string::npos)
            fail("leading zeros in decimal integer literals are not permitted");
        size_t saved = pos;
        pos = start;
        json value = parse_integer(start, 10);
        pos = saved;
        return value;
    }

    void check_number_end() {
        if (pos < text.size() && (isalnum((unsigned char)text[pos]) || text[pos] == '_' || text[pos] == '.'))
            fail("invalid number literal");
    }

    json parse_strings() {
        string result;
        do {
            result += parse_single_string();
        } while (peek() == '\'' || peek() == '"' || at_string_prefix());
        return result;
    }

    string parse_single_string() {
        bool raw = false;
        if (text[pos] != '\'' && text[pos] != '"') {
            raw = tolower(text[pos]) == 'r';
            ++pos;
        }
        char quote = text[pos];
        bool triple = text.compare(pos, 3, string(3, quote)) == 0;
        pos += triple ? 3 : 1;
        size_t begin = pos;
        for (size_t i = begin; i < text.size(); ++i) {
            char c = text[i];
            if (c == '\\') {
                ++i;
            } else if (triple && text.compare(i, 3, string(3, quote)) == 0) {
                pos = i + 3;
                return raw ? text.substr(begin, i - begin) : decode_escapes(text, begin, i);
            } else if (!triple && c == quote) {
                pos = i + 1;
                return raw ? text.substr(begin, i - begin) : decode_escapes(text, begin, i);
            } else if (!triple && c == '\n') {
                break;
            }
        }
        fail("unterminated string literal");
    }

    json parse_name() {
        size_t start = pos;
        while (pos < text.size() && (isalnum((unsigned char)text[pos]) || text[pos] == '_')) ++pos;
        string name = text.substr(start, pos - start);
        if (name == "True") return true;
        if (name == "False") return false;
        if (name == "None") return nullptr;
        if (name == "set") {
            expect('(');
            expect(')');
            return json::array();
        }
        pos = start;
        fail(fmt::format("name '{}' is not a literal", name));
    }
};

json parse_python_literal(const string &text) {
    return literal_parser(text).parse();
}

static string python_string_repr(const string &s) {
    char quote = '\'';
    if (s.find('\'') != string::npos && s.find('"') == string::npos)
        quote = '"';
    string out(1, quote);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == quote) {
                    out += '\\';
                    out += c;
                } else if ((unsigned char)c < 0x20 || c == 0x7F) {
                    out += fmt::format("\\x{:02x}", (unsigned)(unsigned char)c);
                } else {
                    out += c;
                }
        }
    }
    out += quote;
    return out;
}

string to_literal(const json &value) {
    switch (value.type()) {
        case json::value_t::null: return "None";
        case json::value_t::boolean: return value.get<bool>() ? "True" : "False";
        case json::value_t::number_integer: return to_string(value.get<int64_t>());
        case json::value_t::number_unsigned: return to_string(value.get<uint64_t>());
        case json::value_t::number_float: return python_float_repr(value.get<double>());
        case json::value_t::string: return python_string_repr(value.get<string>());
        case json::value_t::array: {
            string out = "[";
            for (size_t i = 0; i < value.size(); ++i) {
                if (i) out += ", ";
                out += to_literal(value[i]);
            }
            return out + "]";
        }
        case json::value_t::object: {
            string out = "{";
            bool first = true;
            for (auto &[key, element] : value.items()) {
                if (!first) out += ", ";
                first = false;
                out += python_string_repr(key) + ": " + to_literal(element);
            }
            return out + "}";
        }
        default:
            return value.dump();
    }
}

string to_display(const json &value) {
    if (value.is_string()) return value.get<string>();
    return to_literal(value);
}

string python_type_name(const json &value) {
    switch (value.type()) {
        case json::value_t::null: return "NoneType";
        case json::value_t::boolean: return "bool";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned: return "int";
        case json::value_t::number_float: return "float";
        case json::value_t::string: return "str";
        case json::value_t::array: return "list";
        case json::value_t::object: return "dict";
        default: return "object";
    }
}

bool python_equal(const json &lhs, const json &rhs) {
    if (lhs.is_boolean() && rhs.is_number())
        return json(lhs.get<bool>() ? 1 : 0) == rhs;
    if (lhs.is_number() && rhs.is_boolean())
        return python_equal(rhs, lhs);
    if (lhs.is_array() && rhs.is_array()) {
        if (lhs.size() != rhs.size()) return false;
        for (size_t i = 0; i < lhs.size(); ++i)
            if (!python_equal(lhs[i], rhs[i])) return false;
        return true;
    }
    if (lhs.is_object() && rhs.is_object()) {
        if (lhs.size() != rhs.size()) return false;
        for (auto &[key, value] : lhs.items()) {
            auto it = rhs.find(key);
            if (it == rhs.end() || !python_equal(value, *it)) return false;
        }
        return true;
    }
    return lhs == rhs;
}

}  // namespace codebench
