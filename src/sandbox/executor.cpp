#include "sandbox/executor.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "sandbox/message.hpp"
#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>
#include <algorithm>

namespace codebench {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static const char *PRELUDE = "from typing import *\n";

static void redirect_output(const fs::path &dir) {
    const pair<int, const char *> streams[] = {{STDOUT_FILENO, STDOUT_FILE}, {STDERR_FILENO, STDERR_FILE}};
    for (auto &[fd, name] : streams) {
        int file = open((dir / name).c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
        if (file < 0) continue;
        dup2(file, fd);
        close(file);
    }
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        close(null_fd);
    }
}

static double cpu_seconds() {
    struct rusage usage;
    getrusage(RUSAGE_SELF, &usage);
    return usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
           usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
}

static py_ref checked(PyObject *object) {
    if (!object) throw fetch_python_error();
    return py_ref(object);
}

static void run_code(const string &code, PyObject *globals) {
    py_ref compiled = checked(Py_CompileString(code.c_str(), "<string>", Py_file_input));
    checked(PyEval_EvalCode(compiled.get(), globals, globals));
}

/**
 * @brief 找到被测函数
 * 未指定函数名时，取被测代码定义的最后一个可调用对象，
 * 由 from typing import * 引入且没有被重新定义的名称不计入。
 */
static py_ref find_function(PyObject *globals, PyObject *prelude, const optional<string> &entry_point) {
    if (entry_point) {
        PyObject *function = PyDict_GetItemString(globals, entry_point->c_str());
        if (!function)
            throw python_error("name '" + *entry_point + "' is not defined", "");
        if (!PyCallable_Check(function))
            throw python_error("'" + *entry_point + "' is not callable", "");
        return py_ref::borrow(function);
    }

    PyObject *key, *value, *last = nullptr;
    Py_ssize_t pos = 0;
    while (PyDict_Next(globals, &pos, &key, &value)) {
        if (!PyCallable_Check(value)) continue;
        if (PyDict_GetItem(prelude, key) == value) continue;
        last = value;
    }
    if (!last)
        throw python_error("no callable object is defined by the source code", "");
    return py_ref::borrow(last);
}

static json inspect_function(PyObject *function) {
    py_ref code = checked(PyObject_GetAttrString(function, "__code__"));
    py_ref names = checked(PyObject_GetAttrString(code.get(), "co_names"));
    return python_to_json(names.get());
}

static json invoke_function(PyObject *function, const json &arguments, const execution_request &request) {
    py_ref list = json_to_python(arguments.is_array() ? arguments : json::array());
    py_ref args = checked(PyList_AsTuple(list.get()));

    py_ref tracemalloc;
    if (request.collect_memory_usage)
        tracemalloc = checked(PyImport_ImportModule("tracemalloc"));

    double total_time = 0;
    int64_t peak_memory = 0;
    py_ref result;
    for (long i = 0; i < request.iterations; ++i) {
        if (request.collect_memory_usage)
            checked(PyObject_CallMethod(tracemalloc.get(), "start", nullptr));

        double start_time = request.collect_cpu_time ? cpu_seconds() : 0;
        result = py_ref(PyObject_Call(function, args.get(), nullptr));
        if (request.collect_cpu_time)
            total_time += cpu_seconds() - start_time;
        if (!result) throw fetch_python_error();

        if (request.collect_memory_usage) {
            py_ref traced = checked(PyObject_CallMethod(tracemalloc.get(), "get_traced_memory", nullptr));
            long long peak = PyLong_AsLongLong(PyTuple_GetItem(traced.get(), 1));
            if (peak == -1 && PyErr_Occurred()) throw fetch_python_error();
            peak_memory = max<int64_t>(peak_memory, peak);
            checked(PyObject_CallMethod(tracemalloc.get(), "stop", nullptr));
        }
    }

    optional<double> cpu_time;
    optional<int64_t> memory;
    if (request.collect_cpu_time) cpu_time = total_time;
    if (request.collect_memory_usage) memory = peak_memory;
    return make_success_message(result ? python_to_json(result.get()) : json(), cpu_time, memory);
}

static void flush_python_streams() {
    for (const char *name : {"stdout", "stderr"}) {
        PyObject *stream = PySys_GetObject(name);
        if (!stream || stream == Py_None) continue;
        py_ref ret(PyObject_CallMethod(stream, "flush", nullptr));
        if (!ret) PyErr_Clear();
    }
}

static json execute(const fs::path &dir) {
    execution_request request;
    request.source = read_file_content(dir / SOURCE_FILE);
    json arguments = json::parse(read_file_content(dir / ARGUMENTS_FILE));
    decode_config(json::parse(read_file_content(dir / CONFIG_FILE)), request);

    initialize_interpreter();
    py_ref globals = checked(PyDict_New());
    if (PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins()) < 0)
        throw fetch_python_error();
    run_code(PRELUDE, globals.get());
    py_ref prelude = checked(PyDict_Copy(globals.get()));

    run_code(request.source, globals.get());

    if (request.mode == execution_mode::INSPECT) {
        if (!request.entry_point)
            throw python_error("inspection requires a function name", "");
        py_ref function = find_function(globals.get(), prelude.get(), request.entry_point);
        return make_success_message(inspect_function(function.get()), nullopt, nullopt);
    }

    py_ref function = find_function(globals.get(), prelude.get(), request.entry_point);
    return invoke_function(function.get(), arguments, request);
}

int run_executor(const fs::path &dir) noexcept {
    redirect_output(dir);

    json message;
    try {
        message = execute(dir);
    } catch (python_error &e) {
        message = make_error_message(e.what(), e.traceback());
    } catch (exception &e) {
        message = make_error_message(e.what(), "");
    }

    if (Py_IsInitialized()) {
        if (PyErr_Occurred()) PyErr_Clear();
        flush_python_streams();
    }

    try {
        write_file_content(dir / RESULT_FILE, message.dump(-1, ' ', false, json::error_handler_t::replace));
    } catch (exception &) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

}  // namespace codebench
