#include <tickgovernor/core/coalescer/wakeup_timer.hpp>
#include <algorithm>
#include <utility>

namespace TickGovernor {

bool WakeupTimer::schedule(const std::string& name, uint64_t due_ns) {
    return due_.emplace(name, due_ns).second;
}

bool WakeupTimer::cancel(const std::string& name) {
    return due_.erase(name) > 0;
}

std::vector<std::string> WakeupTimer::collectDue(uint64_t now_ns) {
    std::vector<std::pair<uint64_t, std::string>> fired;
    for (auto it = due_.begin(); it != due_.end();) {
        if (it->second <= now_ns) {
            fired.emplace_back(it->second, it->first);
            it = due_.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(fired.begin(), fired.end());

    std::vector<std::string> names;
    names.reserve(fired.size());
    for (auto& f : fired) {
        names.push_back(std::move(f.second));
    }
    return names;
}

} // namespace TickGovernor
