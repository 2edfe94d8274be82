#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数不能抛出异常，否则在栈展开过程中会直接 terminate
    try {
        f();
    } catch (std::exception &ex) {
        LOG(ERROR) << "deferred action failed: " << ex.what();
    }
}

void scoped_guard::dismiss() noexcept {
    f = nullptr;
}
