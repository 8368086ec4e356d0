#pragma once
#include <cstddef>
#include <cstdint>

// Tells a recursive walk (parser, evaluator) when the native stack of the
// current thread is nearly used up, so it can fail with an error instead of
// crashing. Stacks are assumed to grow down.
class StackGuard {
   public:
    // Anchor on the calling thread. Call at the entry of each walk.
    void mark();

    bool near_limit() const;

   private:
    uintptr_t low = 0;   // lowest usable address of this thread's stack, 0 if unknown
    size_t margin = 0;   // headroom kept free below the check
    uintptr_t base = 0;  // fallback: position at mark()
    size_t fallback_limit = 0;
};
