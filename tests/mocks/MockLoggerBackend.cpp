#include "MockLoggerBackend.h"

namespace FCE {
namespace Test {

MockLoggerBackend::MockLoggerBackend(RecordBuffer records) : records_(std::move(records)) {}

void MockLoggerBackend::log(LogLevel level, const std::string &message,
                            [[maybe_unused]] const std::source_location &loc) {
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }
    records_->push_back({level, message});
}

void MockLoggerBackend::setLevel(LogLevel level) {
    level_ = level;
}

void MockLoggerBackend::flush() {}

bool MockLoggerBackend::contains(const RecordBuffer &records, LogLevel level, const std::string &fragment) {
    for (const auto &record : *records) {
        if (record.level == level && record.message.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

int MockLoggerBackend::count(const RecordBuffer &records, LogLevel level) {
    int total = 0;
    for (const auto &record : *records) {
        if (record.level == level) {
            total++;
        }
    }
    return total;
}

}  // namespace Test
}  // namespace FCE
