#include "transferd/core/slot_pool.h"
#include "transferd/base/logger.h"

namespace transferd {

SlotPool::SlotPool(uint32_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool SlotPool::try_acquire() {
    if (in_use_ >= capacity_) {
        return false;
    }
    ++in_use_;
    return true;
}

bool SlotPool::release() {
    if (in_use_ == 0) {
        Logger::instance().error("SlotPool released with no slot held");
        return false;
    }
    --in_use_;
    return true;
}

void SlotPool::set_capacity(uint32_t capacity) {
    capacity_ = capacity == 0 ? 1 : capacity;
}

} // namespace transferd
