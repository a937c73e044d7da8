#pragma once

#include <memory>
#include <string>

namespace rh::storage { class Manager; }

namespace rh::protocols::http::model {

// What a handler needs besides the request itself
struct Context {
    std::shared_ptr<storage::Manager> storage;
    std::string publicPrefix;
};

}
