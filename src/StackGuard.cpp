#include "StackGuard.hpp"

#include <pthread.h>
#include <sys/resource.h>

#include <algorithm>

static constexpr size_t kMaxMargin = 256 * 1024;

static size_t rlimit_stack_budget() {
    const size_t margin = 1024 * 1024;  // leave 1MB for the host
    size_t total = 8 * 1024 * 1024;     // typical default ulimit
    struct rlimit rl;
    if (getrlimit(RLIMIT_STACK, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        total = static_cast<size_t>(rl.rlim_cur);
    }
    return total > 2 * margin ? total - margin : total / 2;
}

void StackGuard::mark() {
    volatile char marker = 0;
    base = reinterpret_cast<uintptr_t>(&marker);
    low = 0;

    pthread_attr_t attr;
    if (pthread_getattr_np(pthread_self(), &attr) == 0) {
        void* addr = nullptr;
        size_t size = 0;
        if (pthread_attr_getstack(&attr, &addr, &size) == 0 && addr && size > 0) {
            low = reinterpret_cast<uintptr_t>(addr);
            margin = std::min(kMaxMargin, size / 4);
        }
        pthread_attr_destroy(&attr);
    }

    if (low == 0) fallback_limit = rlimit_stack_budget();
}

bool StackGuard::near_limit() const {
    volatile char probe = 0;
    uintptr_t sp = reinterpret_cast<uintptr_t>(&probe);

    if (low != 0) return sp < low + margin;
    if (base == 0) return false;

    uintptr_t used = base > sp ? base - sp : sp - base;
    return used > fallback_limit;
}
