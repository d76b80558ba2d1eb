#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

#include "constants.h"

// Sliding-window limiter: at most maxPerWindow accepted messages per sender
// inside any windowSeconds span. Not synchronized; the owner serializes access.
class RateLimiter {
    std::unordered_map<std::string, std::deque<double>> windows;
    std::size_t maxPerWindow;
    double windowSeconds;

    void prune(std::deque<double> &w, double now) const {
        while (!w.empty() && now - w.front() >= windowSeconds)
            w.pop_front();
    }

public:
    explicit RateLimiter(std::size_t maxPerWindow = DEFAULT_RATE_LIMIT_PER_SECOND,
                         double windowSeconds = RATE_LIMIT_WINDOW_SECONDS)
        : maxPerWindow(maxPerWindow), windowSeconds(windowSeconds) {}

    bool wouldExceed(const std::string &sender, double now) {
        auto it = windows.find(sender);
        if (it == windows.end())
            return false;
        prune(it->second, now);
        if (it->second.empty()) {
            windows.erase(it);
            return false;
        }
        return it->second.size() >= maxPerWindow;
    }

    void record(const std::string &sender, double now) {
        auto &w = windows[sender];
        prune(w, now);
        w.push_back(now);
    }

    std::size_t limit() const { return maxPerWindow; }
};
