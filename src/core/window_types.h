#pragma once

#include <cstdint>

// Opaque native window identifier (an HWND on Windows).
using WindowHandle = std::uintptr_t;

struct Point {
    int32_t x = 0;
    int32_t y = 0;
};

// Interpretation of the size passed to SetSize().
enum class SizeHint {
    None,   // Resize the window; user may resize freely
    Min,    // Record a minimum tracking size
    Max,    // Record a maximum size
    Fixed,  // Resize the window and disable user resizing
};
