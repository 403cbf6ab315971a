#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "vmexec/execution/embedded_interpreter.h"
#include "vmexec/utils/logger.h"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace vmexec {

namespace {

Logger& interpreter_logger() {
    return LoggerFactory::get_logger("vmexec.interpreter");
}

// How long threads started by the code get to finish after it returns
constexpr int THREAD_GRACE_STEPS = 10;
constexpr std::chrono::milliseconds THREAD_GRACE_STEP{10};

// Owned reference; decremented on destruction
class PyRef {
public:
    PyRef() = default;
    explicit PyRef(PyObject* object) noexcept : object_(object) {}
    PyRef(const PyRef&) = delete;
    PyRef& operator=(const PyRef&) = delete;
    PyRef(PyRef&& other) noexcept : object_(std::exchange(other.object_, nullptr)) {}
    PyRef& operator=(PyRef&& other) noexcept {
        if (this != &other) {
            Py_XDECREF(object_);
            object_ = std::exchange(other.object_, nullptr);
        }
        return *this;
    }
    ~PyRef() { Py_XDECREF(object_); }

    static PyRef borrowed(PyObject* object) noexcept {
        Py_XINCREF(object);
        return PyRef(object);
    }

    [[nodiscard]] PyObject* get() const noexcept { return object_; }
    explicit operator bool() const noexcept { return object_ != nullptr; }

private:
    PyObject* object_ = nullptr;
};

class GilGuard {
public:
    GilGuard() : state_(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(state_); }
    GilGuard(const GilGuard&) = delete;
    GilGuard& operator=(const GilGuard&) = delete;

private:
    PyGILState_STATE state_;
};

// str(object) as UTF-8; undecodable characters are replaced
std::string to_utf8(PyObject* object) {
    if (object == nullptr) {
        return {};
    }
    PyRef text(PyObject_Str(object));
    if (!text) {
        PyErr_Clear();
        return {};
    }
    PyRef bytes(PyUnicode_AsEncodedString(text.get(), "utf-8", "replace"));
    if (!bytes) {
        PyErr_Clear();
        return {};
    }
    return std::string(PyBytes_AS_STRING(bytes.get()), static_cast<size_t>(PyBytes_GET_SIZE(bytes.get())));
}

// Consumes the pending Python error and renders it as "Type: message"
std::string take_error_description() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    PyRef type_ref(type);
    PyRef value_ref(value);
    PyRef traceback_ref(traceback);

    std::string name = type != nullptr && PyType_Check(type)
                           ? reinterpret_cast<PyTypeObject*>(type)->tp_name
                           : "Exception";
    std::string message = to_utf8(value);
    return message.empty() ? name : name + ": " + message;
}

ExecutionError capture_failure(const std::string& what) {
    std::string detail = PyErr_Occurred() ? take_error_description() : "unknown error";
    return ExecutionError{ExecutionError::Kind::UNAVAILABLE, what + ": " + detail};
}

/**
 * Swaps sys.stdin/stdout/stderr for in-memory streams and puts the originals
 * back on destruction. Requires the GIL for its whole lifetime.
 */
class StreamCapture {
public:
    StreamCapture() {
        PyRef io(PyImport_ImportModule("io"));
        if (!io) {
            throw std::runtime_error(capture_failure("cannot import io").message);
        }
        stdin_ = PyRef(PyObject_CallMethod(io.get(), "StringIO", nullptr));
        stdout_ = PyRef(PyObject_CallMethod(io.get(), "StringIO", nullptr));
        stderr_ = PyRef(PyObject_CallMethod(io.get(), "StringIO", nullptr));
        if (!stdin_ || !stdout_ || !stderr_) {
            throw std::runtime_error(capture_failure("cannot create capture buffers").message);
        }

        saved_stdin_ = PyRef::borrowed(PySys_GetObject("stdin"));
        saved_stdout_ = PyRef::borrowed(PySys_GetObject("stdout"));
        saved_stderr_ = PyRef::borrowed(PySys_GetObject("stderr"));

        if (PySys_SetObject("stdin", stdin_.get()) != 0 ||
            PySys_SetObject("stdout", stdout_.get()) != 0 ||
            PySys_SetObject("stderr", stderr_.get()) != 0) {
            std::string message = capture_failure("cannot redirect standard streams").message;
            restore();
            throw std::runtime_error(message);
        }
    }

    ~StreamCapture() { restore(); }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string stdout_text() const { return buffer_value(stdout_.get()); }
    std::string stderr_text() const { return buffer_value(stderr_.get()); }

private:
    void restore() noexcept {
        if (restored_) {
            return;
        }
        restored_ = true;
        restore_one("stdin", saved_stdin_);
        restore_one("stdout", saved_stdout_);
        restore_one("stderr", saved_stderr_);
    }

    static void restore_one(const char* name, const PyRef& saved) noexcept {
        PyObject* value = saved ? saved.get() : Py_None;
        if (PySys_SetObject(name, value) != 0) {
            PyErr_Clear();
        }
    }

    static std::string buffer_value(PyObject* buffer) {
        PyRef value(PyObject_CallMethod(buffer, "getvalue", nullptr));
        if (!value) {
            PyErr_Clear();
            return {};
        }
        return to_utf8(value.get());
    }

    PyRef stdin_, stdout_, stderr_;
    PyRef saved_stdin_, saved_stdout_, saved_stderr_;
    bool restored_ = false;
};

// Maps a pending SystemExit to an exit code, appending any message to stderr
int take_system_exit(std::string& stderr_text) {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    PyRef type_ref(type);
    PyRef value_ref(value);
    PyRef traceback_ref(traceback);

    PyRef code(value != nullptr ? PyObject_GetAttrString(value, "code") : nullptr);
    if (!code) {
        PyErr_Clear();
        return 1;
    }
    if (code.get() == Py_None) {
        return 0;
    }
    if (PyLong_Check(code.get())) {
        int overflow = 0;
        long exit_code = PyLong_AsLongAndOverflow(code.get(), &overflow);
        if (overflow != 0 || (exit_code == -1 && PyErr_Occurred())) {
            PyErr_Clear();
            return 1;
        }
        // Same truncation the operating system applies to a process exit status
        return static_cast<int>(exit_code & 0xFF);
    }
    stderr_text += to_utf8(code.get()) + "\n";
    return 1;
}

// Threads started from Python (threading or _thread) that are still running; -1 on error
long running_python_threads() {
    PyRef thread_module(PyImport_ImportModule("_thread"));
    if (!thread_module) {
        PyErr_Clear();
        return -1;
    }
    PyRef count(PyObject_CallMethod(thread_module.get(), "_count", nullptr));
    if (!count) {
        PyErr_Clear();
        return -1;
    }
    long value = PyLong_AsLong(count.get());
    if (value == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return -1;
    }
    return value;
}

// True when more threads run than before the evaluation, after a short grace period
bool threads_outlive_evaluation(long threads_before) {
    for (int step = 0;; ++step) {
        long running = running_python_threads();
        if (running >= 0 && running <= threads_before) {
            return false;
        }
        if (running < 0 || step == THREAD_GRACE_STEPS) {
            return true;
        }
        Py_BEGIN_ALLOW_THREADS
        std::this_thread::sleep_for(THREAD_GRACE_STEP);
        Py_END_ALLOW_THREADS
    }
}

// Puts builtins.__dict__ back to its snapshot; names the code added are removed
bool restore_builtins(PyObject* builtins_dict, PyObject* pristine) {
    PyRef keys(PyDict_Keys(builtins_dict));
    if (!keys) {
        PyErr_Clear();
        return false;
    }
    for (Py_ssize_t i = 0; i < PyList_GET_SIZE(keys.get()); ++i) {
        PyObject* key = PyList_GET_ITEM(keys.get(), i);
        int known = PyDict_Contains(pristine, key);
        if (known < 0 || (known == 0 && PyDict_DelItem(builtins_dict, key) != 0)) {
            PyErr_Clear();
            return false;
        }
    }
    if (PyDict_Update(builtins_dict, pristine) != 0) {
        PyErr_Clear();
        return false;
    }
    return true;
}

} // namespace

EmbeddedInterpreter& EmbeddedInterpreter::instance() {
    static EmbeddedInterpreter interpreter;
    return interpreter;
}

std::expected<void, ExecutionError> EmbeddedInterpreter::ensure_initialized() {
    std::call_once(init_once_, [this] {
        if (Py_IsInitialized()) {
            interpreter_logger().debug("Python interpreter already running in this process");
            return;
        }

        PyConfig config;
        PyConfig_InitPythonConfig(&config);
        config.install_signal_handlers = 0;
        config.parse_argv = 0;
        config.buffered_stdio = 0;

        PyStatus status = Py_InitializeFromConfig(&config);
        PyConfig_Clear(&config);
        if (PyStatus_Exception(status)) {
            std::string reason = status.err_msg != nullptr ? status.err_msg : "initialization failed";
            if (status.func != nullptr) {
                reason = std::string(status.func) + ": " + reason;
            }
            init_error_ = ExecutionError{ExecutionError::Kind::UNAVAILABLE, reason};
            interpreter_logger().warn("Embedded Python unavailable: " + reason);
            return;
        }

        // Worker threads take the GIL through PyGILState_Ensure
        PyEval_SaveThread();
        interpreter_logger().info(std::string("Embedded Python ") + Py_GetVersion());
    });

    if (init_error_) {
        return std::unexpected(*init_error_);
    }
    return {};
}

std::expected<ExecutionResult, ExecutionError> EmbeddedInterpreter::evaluate(const std::string& code) {
    if (auto ready = ensure_initialized(); !ready) {
        return std::unexpected(ready.error());
    }

    std::unique_lock lock(evaluation_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return std::unexpected(ExecutionError{ExecutionError::Kind::UNAVAILABLE,
                                              "interpreter busy with another evaluation"});
    }
    if (tainted_.load()) {
        return std::unexpected(ExecutionError{ExecutionError::Kind::UNAVAILABLE,
                                              "interpreter has threads left running by an earlier evaluation"});
    }

    if (code.find('\0') != std::string::npos) {
        return ExecutionResult::failure("Execution error: ValueError: source code string cannot contain null bytes");
    }

    GilGuard gil;

    PyRef globals(PyDict_New());
    PyRef main_name(PyUnicode_FromString("__main__"));
    PyRef builtins(PyImport_ImportModule("builtins"));
    if (!globals || !main_name || !builtins ||
        PyDict_SetItemString(globals.get(), "__name__", main_name.get()) != 0 ||
        PyDict_SetItemString(globals.get(), "__builtins__", builtins.get()) != 0) {
        return std::unexpected(capture_failure("cannot build evaluation namespace"));
    }

    PyObject* builtins_dict = PyModule_GetDict(builtins.get());
    if (pristine_builtins_ == nullptr) {
        pristine_builtins_ = PyDict_Copy(builtins_dict);
        if (pristine_builtins_ == nullptr) {
            return std::unexpected(capture_failure("cannot snapshot builtins"));
        }
    }

    long threads_before = running_python_threads();
    if (threads_before < 0) {
        return std::unexpected(ExecutionError{ExecutionError::Kind::UNAVAILABLE, "cannot count interpreter threads"});
    }

    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool threads_left = false;
    try {
        StreamCapture capture;

        PyRef value(PyRun_String(code.c_str(), Py_file_input, globals.get(), globals.get()));
        std::string error_suffix;
        if (!value) {
            if (PyErr_ExceptionMatches(PyExc_SystemExit)) {
                exit_code = take_system_exit(error_suffix);
            } else {
                error_suffix = "\nExecution error: " + take_error_description();
                exit_code = 1;
            }
        }

        // Output written by the code's threads during the grace period still belongs to it
        threads_left = threads_outlive_evaluation(threads_before);

        stdout_text = capture.stdout_text();
        stderr_text = capture.stderr_text() + error_suffix;
    } catch (const std::runtime_error& e) {
        PyDict_Clear(globals.get());
        if (!restore_builtins(builtins_dict, pristine_builtins_)) {
            taint("builtins could not be restored");
        }
        return std::unexpected(ExecutionError{ExecutionError::Kind::UNAVAILABLE, e.what()});
    }

    if (threads_left) {
        taint("code left threads running");
    }
    if (!restore_builtins(builtins_dict, pristine_builtins_)) {
        taint("builtins could not be restored");
    }

    // Functions defined by the code reference the namespace; break the cycle now
    PyDict_Clear(globals.get());
    return ExecutionResult(std::move(stdout_text), std::move(stderr_text), exit_code);
}

void EmbeddedInterpreter::taint(const std::string& reason) {
    if (tainted_.exchange(true)) {
        return;
    }
    interpreter_logger().with_field("state", "tainted");
    interpreter_logger().warn("Embedded Python disabled, requests now run in a child process: " + reason);
}

} // namespace vmexec
