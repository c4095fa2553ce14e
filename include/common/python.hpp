#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include "common/exceptions.hpp"
#include <nlohmann/json.hpp>
#include <string>

/**
 * 这个头文件包含嵌入式 CPython 的辅助工具
 * 解释器只会在沙箱子进程中初始化，评测进程本身不会执行任何被测代码。
 */
namespace codebench {

/**
 * @brief PyObject 的强引用，析构时释放引用
 * 构造时接管传入的引用（即 Python C API 中的 new reference）
 */
class py_ref {
public:
    py_ref() : obj(nullptr) {}
    explicit py_ref(PyObject *obj) : obj(obj) {}
    py_ref(py_ref &&other) noexcept : obj(other.release()) {}
    py_ref(const py_ref &) = delete;
    ~py_ref() { Py_XDECREF(obj); }

    py_ref &operator=(py_ref &&other) noexcept;
    py_ref &operator=(const py_ref &) = delete;

    /**
     * @brief 从借用引用（borrowed reference）构造，会增加引用计数
     */
    static py_ref borrow(PyObject *obj);

    PyObject *get() const { return obj; }

    /**
     * @brief 放弃所有权，返回的引用需要调用者释放
     */
    PyObject *release();

    explicit operator bool() const { return obj != nullptr; }

private:
    PyObject *obj;
};

/**
 * @brief 表示被测代码抛出的 Python 异常
 * what() 为 str(exception)，traceback() 为 traceback.format_exception 的结果
 */
struct python_error : public benchmark_exception {
    python_error(const std::string &message, const std::string &traceback);

    const std::string &traceback() const;

private:
    std::string trace;
};

/**
 * @brief 取出并清除当前线程的 Python 异常
 * @return 对应的 python_error，没有异常时返回一个说明为 unknown error 的 python_error
 */
python_error fetch_python_error();

/**
 * @brief 初始化 Python 解释器，不安装信号处理函数
 */
void initialize_interpreter();

/**
 * @brief 将 JSON 值转换为 Python 对象
 * 数组转为 list，对象转为 dict
 * @throw python_error 若 Python 对象创建失败
 */
py_ref json_to_python(const nlohmann::json &value);

/**
 * @brief 将 Python 对象转换为 JSON 值，规则与 json.dumps 相同
 * tuple 和 list 转为数组；dict 的 int, float, bool, None 键转为字符串。
 * @throw python_error 若对象无法序列化，比如 set 或自定义类的实例
 */
nlohmann::json python_to_json(PyObject *object);

}  // namespace codebench
