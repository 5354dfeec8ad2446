#include "safepy/namespace.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace py = pybind11;

namespace safepy {

namespace {

bool IsDunder(const std::string& name) {
    return name.size() > 4
        && name.compare(0, 2, "__") == 0
        && name.compare(name.size() - 2, 2, "__") == 0;
}

} // anonymous namespace

Namespace::Namespace() {
    if (!Py_IsInitialized()) {
        throw std::runtime_error("Namespace requires an initialized Python interpreter");
    }

    py::gil_scoped_acquire acquire;

    globals_ = py::dict();
    py::module_ builtins = py::module_::import("builtins");
    builtins_ = py::dict(builtins.attr("__dict__").attr("copy")());

    globals_["__builtins__"] = builtins_;
    globals_["__name__"] = "__sandbox__";
    spdlog::debug("Namespace created ({} builtins)", builtins_.size());
}

Namespace::~Namespace() {
    // Python objects need the GIL to be released; after finalization the
    // references are simply abandoned.
    if (!Py_IsInitialized()) {
        (void)globals_.release();
        (void)builtins_.release();
        return;
    }

    py::gil_scoped_acquire acquire;
    globals_ = py::dict();
    builtins_ = py::dict();
}

bool Namespace::Contains(const std::string& name) const {
    py::gil_scoped_acquire acquire;
    return globals_.contains(name);
}

std::optional<std::string> Namespace::Repr(const std::string& name) const {
    py::gil_scoped_acquire acquire;
    if (!globals_.contains(name)) {
        return std::nullopt;
    }

    try {
        return std::string(py::repr(globals_[py::str(name)]));
    } catch (const py::error_already_set& e) {
        spdlog::warn("repr() of '{}' failed: {}", name, e.what());
        return std::nullopt;
    }
}

std::vector<std::string> Namespace::Names() const {
    py::gil_scoped_acquire acquire;
    std::vector<std::string> names;
    for (auto item : globals_) {
        std::string name = py::str(item.first);
        if (!IsDunder(name)) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t Namespace::Size() const {
    return Names().size();
}

} // namespace safepy
