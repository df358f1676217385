#pragma once

#include "runtime/IOutputSink.h"
#include <gmock/gmock.h>
#include <string>

namespace TCE {
namespace Test {

/**
 * @brief gmock sink for checking which outputs a batch writes
 */
class MockOutputSink : public IOutputSink {
public:
    MOCK_METHOD(void, write, (const std::string &path, const std::string &text), (override));
};

}  // namespace Test
}  // namespace TCE
