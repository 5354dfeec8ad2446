#pragma once

#include "api_export.h"
#include <mutex>
#include <string>

namespace safepy {

/**
 * OutputSink - in-memory text stream handed to one execution
 *
 * Exposed to Python as _safepy_io.OutputSink (write/flush), so it can
 * stand in for sys.stdout and be passed to print() directly. Writes come from the worker thread while the
 * caller may read a partial snapshot after a timeout, hence the lock.
 */
class SAFEPY_API OutputSink {
public:
    OutputSink() = default;

    size_t Write(const std::string& text);
    void Flush() {}

    std::string Contents() const;
    size_t Size() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::string buffer_;
};

} // namespace safepy
