#pragma once

#include <algorithm>
#include <cmath>

inline double ease_in_out_cubic(double p) {
    return p < 0.5 ? 4.0 * p * p * p : 1.0 - std::pow(-2.0 * p + 2.0, 3) / 2.0;
}

inline double ease_out_quart(double p) {
    return 1.0 - std::pow(1.0 - p, 4);
}

inline double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

inline double lerp(double a, double b, double k) {
    return a + (b - a) * k;
}
