#include "common/python.hpp"
#include <fmt/format.h>

namespace codebench {
using namespace std;
using namespace nlohmann;

py_ref &py_ref::operator=(py_ref &&other) noexcept {
    if (this != &other) {
        Py_XDECREF(obj);
        obj = other.release();
    }
    return *this;
}

py_ref py_ref::borrow(PyObject *obj) {
    Py_XINCREF(obj);
    return py_ref(obj);
}

PyObject *py_ref::release() {
    PyObject *result = obj;
    obj = nullptr;
    return result;
}

python_error::python_error(const string &message, const string &traceback)
    : benchmark_exception(message), trace(traceback) {}

const string &python_error::traceback() const {
    return trace;
}

static string to_utf8(PyObject *object) {
    if (!object) return "";
    py_ref str(PyObject_Str(object));
    if (!str) {
        PyErr_Clear();
        return "<unprintable object>";
    }
    const char *data = PyUnicode_AsUTF8(str.get());
    if (!data) {
        PyErr_Clear();
        return "<unprintable object>";
    }
    return data;
}

static string format_traceback(PyObject *type, PyObject *value, PyObject *tb) {
    py_ref module(PyImport_ImportModule("traceback"));
    if (!module) {
        PyErr_Clear();
        return "";
    }
    py_ref lines(PyObject_CallMethod(module.get(), "format_exception", "OOO",
                                     type, value ? value : Py_None, tb ? tb : Py_None));
    if (!lines) {
        PyErr_Clear();
        return "";
    }
    string result;
    py_ref iter(PyObject_GetIter(lines.get()));
    if (!iter) {
        PyErr_Clear();
        return "";
    }
    while (py_ref line{PyIter_Next(iter.get())})
        result += to_utf8(line.get());
    PyErr_Clear();
    return result;
}

python_error fetch_python_error() {
    PyObject *type = nullptr, *value = nullptr, *tb = nullptr;
    PyErr_Fetch(&type, &value, &tb);
    if (!type)
        return python_error("unknown error", "");
    PyErr_NormalizeException(&type, &value, &tb);
    if (tb && value)
        PyException_SetTraceback(value, tb);
    py_ref type_ref(type), value_ref(value), tb_ref(tb);

    return python_error(to_utf8(value), format_traceback(type, value, tb));
}

void initialize_interpreter() {
    if (!Py_IsInitialized())
        Py_InitializeEx(0);
}

static py_ref checked(PyObject *object) {
    if (!object) throw fetch_python_error();
    return py_ref(object);
}

py_ref json_to_python(const json &value) {
    switch (value.type()) {
        case json::value_t::null:
            return py_ref::borrow(Py_None);
        case json::value_t::boolean:
            return checked(PyBool_FromLong(value.get<bool>()));
        case json::value_t::number_integer:
            return checked(PyLong_FromLongLong(value.get<int64_t>()));
        case json::value_t::number_unsigned:
            return checked(PyLong_FromUnsignedLongLong(value.get<uint64_t>()));
        case json::value_t::number_float:
            return checked(PyFloat_FromDouble(value.get<double>()));
        case json::value_t::string: {
            auto &str = value.get_ref<const string &>();
            return checked(PyUnicode_FromStringAndSize(str.data(), (Py_ssize_t)str.size()));
        }
        case json::value_t::array: {
            py_ref list = checked(PyList_New((Py_ssize_t)value.size()));
            for (size_t i = 0; i < value.size(); ++i)
                PyList_SET_ITEM(list.get(), (Py_ssize_t)i, json_to_python(value[i]).release());
            return list;
        }
        case json::value_t::object: {
            py_ref dict = checked(PyDict_New());
            for (auto &[key, element] : value.items()) {
                py_ref item = json_to_python(element);
                if (PyDict_SetItemString(dict.get(), key.c_str(), item.get()) < 0)
                    throw fetch_python_error();
            }
            return dict;
        }
        default:
            throw python_error(fmt::format("unsupported JSON value {}", value.dump()), "");
    }
}

static string type_name(PyObject *object) {
    return Py_TYPE(object)->tp_name;
}

static json long_to_json(PyObject *object) {
    int overflow = 0;
    long long value = PyLong_AsLongLongAndOverflow(object, &overflow);
    if (value == -1 && PyErr_Occurred()) throw fetch_python_error();
    if (!overflow) return (int64_t)value;
    if (overflow > 0) {
        unsigned long long uvalue = PyLong_AsUnsignedLongLong(object);
        if (!PyErr_Occurred()) return (uint64_t)uvalue;
        PyErr_Clear();
    }
    // 超出 64 位整数范围，只能以浮点数近似
    double approx = PyLong_AsDouble(object);
    if (approx == -1.0 && PyErr_Occurred()) throw fetch_python_error();
    return approx;
}

static string dict_key(PyObject *key) {
    if (PyUnicode_Check(key)) {
        const char *data = PyUnicode_AsUTF8(key);
        if (!data) throw fetch_python_error();
        return data;
    }
    if (key == Py_True) return "true";
    if (key == Py_False) return "false";
    if (key == Py_None) return "null";
    if (PyLong_Check(key)) return to_utf8(key);
    if (PyFloat_Check(key)) {
        py_ref repr = checked(PyObject_Repr(key));
        return to_utf8(repr.get());
    }
    throw python_error(fmt::format("keys must be str, int, float, bool or None, not {}", type_name(key)), "");
}

json python_to_json(PyObject *object) {
    if (object == Py_None) return nullptr;
    if (PyBool_Check(object)) return object == Py_True;
    if (PyLong_Check(object)) return long_to_json(object);
    if (PyFloat_Check(object)) return PyFloat_AsDouble(object);
    if (PyUnicode_Check(object)) {
        Py_ssize_t size = 0;
        const char *data = PyUnicode_AsUTF8AndSize(object, &size);
        if (!data) throw fetch_python_error();
        return string(data, (size_t)size);
    }

    if (Py_EnterRecursiveCall(" while converting a Python object to JSON"))
        throw fetch_python_error();
    json result;
    try {
        if (PyList_Check(object) || PyTuple_Check(object)) {
            result = json::array();
            py_ref seq = checked(PySequence_Fast(object, "expected a sequence"));
            Py_ssize_t size = PySequence_Fast_GET_SIZE(seq.get());
            for (Py_ssize_t i = 0; i < size; ++i)
                result.push_back(python_to_json(PySequence_Fast_GET_ITEM(seq.get(), i)));
        } else if (PyDict_Check(object)) {
            result = json::object();
            PyObject *key, *value;
            Py_ssize_t pos = 0;
            while (PyDict_Next(object, &pos, &key, &value))
                result[dict_key(key)] = python_to_json(value);
        } else {
            throw python_error(fmt::format("Object of type {} is not JSON serializable", type_name(object)), "");
        }
    } catch (...) {
        Py_LeaveRecursiveCall();
        throw;
    }
    Py_LeaveRecursiveCall();
    return result;
}

}  // namespace codebench
