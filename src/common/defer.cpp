#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace grader {
using namespace std;

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(function<void()> f) : f(move(f)) {}

scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (const exception &e) {
        LOG(ERROR) << "Scoped cleanup failed: " << e.what();
    }
}

scoped_guard scoped_guard::operator+(function<void()> f) const {
    return scoped_guard(move(f));
}

}  // namespace grader
