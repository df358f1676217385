#pragma once

#include <string>

namespace TCE {

/**
 * @brief Destination of converted unit text
 *
 * Shared between the units of a batch; implementations must accept
 * concurrent write() calls.
 */
class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    /**
     * @brief Store the complete text for one output path
     * @throws std::runtime_error on I/O failure
     */
    virtual void write(const std::string &path, const std::string &text) = 0;
};

}  // namespace TCE
