#pragma once

#include "api_export.h"
#include <pybind11/pybind11.h>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace safepy {

/**
 * Namespace - persistent variable environment of one Sandbox
 *
 * Wraps the globals dictionary every submitted program runs against. The
 * dictionary carries its own copy of the builtins table, so rebinding a
 * builtin (the sandbox binds print to the per-call output sink) never
 * leaks into the rest of the process.
 *
 * Single writer: only one execution may use a Namespace at a time.
 * Accessors acquire the GIL themselves.
 */
class SAFEPY_API Namespace {
public:
    Namespace();
    ~Namespace();

    Namespace(const Namespace&) = delete;
    Namespace& operator=(const Namespace&) = delete;

    bool Contains(const std::string& name) const;

    // repr() of the bound value, nullopt when unbound
    std::optional<std::string> Repr(const std::string& name) const;

    // User-visible names (dunder entries excluded), sorted
    std::vector<std::string> Names() const;
    size_t Size() const;

    // Incremented once per execution that ran code against this namespace
    uint64_t Version() const { return version_.load(); }
    void BumpVersion() { version_.fetch_add(1); }

    // Raw access for the execution path. Caller must hold the GIL.
    pybind11::dict& Globals() { return globals_; }
    pybind11::dict& Builtins() { return builtins_; }

private:
    pybind11::dict globals_;
    pybind11::dict builtins_;
    std::atomic<uint64_t> version_{0};
};

} // namespace safepy
