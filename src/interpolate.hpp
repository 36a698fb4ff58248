#pragma once

#include <optional>
#include <vector>

// Linear interpolation over samples sorted ascending by `t`.
// Sample types need public `double t, x, y` members.
// Outside the sampled range the boundary sample is returned unchanged;
// an empty sequence yields no value.
template <typename Sample>
std::optional<Sample> interpolate_at(double t, const std::vector<Sample>& samples) {
    if (samples.empty()) return std::nullopt;
    if (samples.size() == 1) return samples.front();
    if (t <= samples.front().t) return samples.front();
    if (t >= samples.back().t) return samples.back();

    // Invariant: samples[lo].t <= t < samples[hi].t
    size_t lo = 0;
    size_t hi = samples.size() - 1;
    while (lo + 1 < hi) {
        size_t mid = (lo + hi) / 2;
        if (samples[mid].t <= t) lo = mid;
        else hi = mid;
    }
    const Sample& a = samples[lo];
    const Sample& b = samples[hi];
    if (a.t == b.t) return a;

    double p = (t - a.t) / (b.t - a.t);
    Sample out = a;
    out.t = t;
    out.x = a.x + (b.x - a.x) * p;
    out.y = a.y + (b.y - a.y) * p;
    return out;
}
