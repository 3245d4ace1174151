#pragma once
#include <chrono>

// Normalized control message from the foot controller.
// CC number or note number, and its value or velocity.
struct InputEvent {
    int sourceCode = 0;
    int value      = 0;   // 0..127
    std::chrono::steady_clock::time_point receivedAt =
        std::chrono::steady_clock::now();
};
