#ifndef TRANSFERD_CORE_SLOT_POOL_H
#define TRANSFERD_CORE_SLOT_POOL_H

#include <cstdint>

namespace transferd {

// Bounded counter gating admission. Not synchronized: the owner serializes access.
class SlotPool {
public:
    explicit SlotPool(uint32_t capacity);

    // Take a slot if one is free
    bool try_acquire();

    // Return a slot; releasing more than acquired is a logic error and is ignored
    bool release();

    // Lowering below in_use() never revokes held slots
    void set_capacity(uint32_t capacity);

    uint32_t capacity() const { return capacity_; }
    uint32_t in_use() const { return in_use_; }
    uint32_t available() const { return in_use_ >= capacity_ ? 0 : capacity_ - in_use_; }

private:
    uint32_t capacity_;
    uint32_t in_use_ = 0;
};

} // namespace transferd

#endif // TRANSFERD_CORE_SLOT_POOL_H
