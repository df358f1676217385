#pragma once

#include "runtime/IOutputSink.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace TCE {

/**
 * @brief Writes converted units to disk, one writer per path at a time
 *
 * Writes to different paths proceed in parallel; writes to the same path are
 * serialized so that two units targeting one file never interleave.
 */
class FileOutputSink : public IOutputSink {
public:
    void write(const std::string &path, const std::string &text) override;

    size_t getWriteCount() const;

private:
    std::shared_ptr<std::mutex> lockFor(const std::string &path);

    mutable std::mutex mapMutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> pathLocks_;
    size_t writeCount_ = 0;
};

}  // namespace TCE
