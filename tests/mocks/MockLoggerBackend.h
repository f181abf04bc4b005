#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <string>
#include <vector>

namespace FCE {
namespace Test {

/**
 * @brief Mock implementation of ILoggerBackend for testing
 *
 * Records every message into a buffer shared with the test, so records
 * stay readable after ownership moves into the Logger.
 */
class MockLoggerBackend : public ILoggerBackend {
public:
    struct Record {
        LogLevel level;
        std::string message;
    };

    using RecordBuffer = std::shared_ptr<std::vector<Record>>;

    explicit MockLoggerBackend(RecordBuffer records);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    // Test inspection helpers over a record buffer
    static bool contains(const RecordBuffer &records, LogLevel level, const std::string &fragment);
    static int count(const RecordBuffer &records, LogLevel level);

private:
    RecordBuffer records_;
    LogLevel level_ = LogLevel::Trace;
};

}  // namespace Test
}  // namespace FCE
