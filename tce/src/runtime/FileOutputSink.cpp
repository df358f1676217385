#include "runtime/FileOutputSink.h"
#include "common/Logger.h"
#include <fstream>
#include <stdexcept>

namespace TCE {

std::shared_ptr<std::mutex> FileOutputSink::lockFor(const std::string &path) {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto &entry = pathLocks_[path];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void FileOutputSink::write(const std::string &path, const std::string &text) {
    std::shared_ptr<std::mutex> pathLock = lockFor(path);
    std::lock_guard<std::mutex> lock(*pathLock);

    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to create output file: " + path);
    }
    file << text;
    if (!file) {
        throw std::runtime_error("Failed to write to output file: " + path);
    }

    std::lock_guard<std::mutex> countLock(mapMutex_);
    ++writeCount_;
    LOG_DEBUG("FileOutputSink: wrote {} bytes to {}", text.size(), path);
}

size_t FileOutputSink::getWriteCount() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    return writeCount_;
}

}  // namespace TCE
