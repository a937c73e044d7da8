#include "storage/NameLockTable.hpp"

using namespace rh::storage;

NameLockTable::Guard::Guard(NameLockTable& table, std::string name)
    : table_(table), name_(std::move(name)), slot_(table_.checkout(name_)) {
    slot_->mtx.lock();
}

NameLockTable::Guard::~Guard() {
    slot_->mtx.unlock();
    table_.release(name_);
}

std::shared_ptr<NameLockTable::Slot> NameLockTable::checkout(const std::string& name) {
    std::scoped_lock lock(mutex_);
    auto& slot = slots_[name];
    if (!slot) slot = std::make_shared<Slot>();
    ++slot->users;
    return slot;
}

void NameLockTable::release(const std::string& name) {
    std::scoped_lock lock(mutex_);
    const auto it = slots_.find(name);
    if (it == slots_.end()) return;
    if (--it->second->users == 0) slots_.erase(it);
}

std::size_t NameLockTable::activeNames() const {
    std::scoped_lock lock(mutex_);
    return slots_.size();
}
