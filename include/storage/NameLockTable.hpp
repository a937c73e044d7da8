#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rh::storage {

// One mutex per stored name, alive only while someone holds or waits on it.
// Operations on different names never contend.
class NameLockTable {
    struct Slot {
        std::mutex mtx;
        unsigned int users{0};
    };

public:
    class Guard {
    public:
        Guard(NameLockTable& table, std::string name);
        ~Guard();
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
    private:
        NameLockTable& table_;
        std::string name_;
        std::shared_ptr<Slot> slot_;
    };

    [[nodiscard]] Guard acquire(const std::string& name) { return {*this, name}; }

    [[nodiscard]] std::size_t activeNames() const;

private:
    std::shared_ptr<Slot> checkout(const std::string& name);
    void release(const std::string& name);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

}
