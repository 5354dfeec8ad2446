#include "safepy/output_sink.h"
#include <pybind11/embed.h>

namespace py = pybind11;

// Registered at static-init time, imported by the sandbox before each run
PYBIND11_EMBEDDED_MODULE(_safepy_io, m) {
    m.doc() = "Output capture for sandboxed code";

    py::class_<safepy::OutputSink, std::shared_ptr<safepy::OutputSink>>(m, "OutputSink")
        .def("write", &safepy::OutputSink::Write, py::arg("text"))
        .def("flush", &safepy::OutputSink::Flush)
        .def("isatty", [](const safepy::OutputSink&) { return false; })
        .def("writable", [](const safepy::OutputSink&) { return true; })
        .def_property_readonly("encoding", [](const safepy::OutputSink&) { return "utf-8"; })
        .def("getvalue", &safepy::OutputSink::Contents);
}

namespace safepy {

size_t OutputSink::Write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += text;
    return text.size();
}

std::string OutputSink::Contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

size_t OutputSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

void OutputSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
}

} // namespace safepy
