#include "core/types/ScanConfig.hpp"

#include <limits>

namespace tcpscan::core {

int64_t ScanConfig::passLimit() const {
    if (loopPolicy != LoopPolicy::FixedCount) {
        return std::numeric_limits<int64_t>::max();
    }
    if (!loopCount) {
        return 1;
    }
    if (*loopCount == 0) {
        return std::numeric_limits<int64_t>::max();
    }
    return *loopCount;
}

} // namespace tcpscan::core
