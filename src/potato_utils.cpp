#include "potato_utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <limits>

namespace potato {

// Utils 实现
Timestamp Utils::getCurrentTime() {
    return std::chrono::system_clock::now();
}

bool Utils::isNumeric(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool Utils::parseIndex(const std::string& str, int64_t& index) {
    if (str == "-1") {
        index = -1;
        return true;
    }
    if (!isNumeric(str)) {
        return false;
    }
    try {
        index = std::stoll(str);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool Utils::parseDuration(const std::string& str, Duration& duration) {
    std::string number = str;
    int64_t multiplier = 1;

    if (number.size() > 2 && number.compare(number.size() - 2, 2, "ms") == 0) {
        number = number.substr(0, number.size() - 2);
    } else if (number.size() > 1 && number.back() == 's') {
        number.pop_back();
        multiplier = 1000;
    } else if (number.size() > 1 && number.back() == 'm') {
        number.pop_back();
        multiplier = 60 * 1000;
    }

    if (!isNumeric(number)) {
        return false;
    }
    int64_t value = 0;
    try {
        value = std::stoll(number);
    } catch (const std::out_of_range&) {
        return false;
    }
    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        return false;
    }
    duration = Duration(value * multiplier);
    return true;
}

Duration Utils::fromNanoseconds(int64_t nanoseconds) {
    const int64_t ns_per_ms = 1000 * 1000;
    int64_t ms = nanoseconds / ns_per_ms;
    // 余数不为零时远离零取整，保证非零值不会变成0
    if (nanoseconds % ns_per_ms != 0) {
        ms += nanoseconds > 0 ? 1 : -1;
    }
    return Duration(ms);
}

int64_t Utils::toNanoseconds(Duration duration) {
    const int64_t ns_per_ms = 1000 * 1000;
    const int64_t limit = std::numeric_limits<int64_t>::max() / ns_per_ms;
    if (duration.count() > limit) {
        return std::numeric_limits<int64_t>::max();
    }
    if (duration.count() < -limit) {
        return std::numeric_limits<int64_t>::min();
    }
    return duration.count() * ns_per_ms;
}

Timestamp Utils::addDuration(Timestamp base, Duration duration) {
    if (duration >= Duration::zero()) {
        // 超出可表示范围时饱和为Timestamp::max()
        Duration headroom = std::chrono::duration_cast<Duration>(Timestamp::max() - base);
        if (duration >= headroom) {
            return Timestamp::max();
        }
        return base + duration;
    }

    // 向前不超过纪元起点
    Duration elapsed = std::chrono::duration_cast<Duration>(base.time_since_epoch());
    if (duration <= -elapsed) {
        return Timestamp();
    }
    return base + duration;
}

} // namespace potato
