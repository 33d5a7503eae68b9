#pragma once

#include <cstdint>
#include <string>

namespace dic::stats {

enum class Category {
    Chinese,
    English,
    Number,
    Symbol,
    Other,
};

[[nodiscard]] const char* categoryName(Category category) noexcept;

// Per-category character counts. total always equals the sum of the five
// category fields.
struct CounterSet {
    std::int64_t chinese{0};
    std::int64_t english{0};
    std::int64_t number{0};
    std::int64_t symbol{0};
    std::int64_t other{0};
    std::int64_t total{0};

    void add(Category category, std::int64_t amount = 1);

    [[nodiscard]] bool empty() const noexcept { return total == 0; }

    CounterSet& operator+=(const CounterSet& rhs);
    CounterSet& operator-=(const CounterSet& rhs);
};

inline CounterSet operator+(CounterSet lhs, const CounterSet& rhs) {
    lhs += rhs;
    return lhs;
}

inline CounterSet operator-(CounterSet lhs, const CounterSet& rhs) {
    lhs -= rhs;
    return lhs;
}

inline bool operator==(const CounterSet& lhs, const CounterSet& rhs) {
    return lhs.chinese == rhs.chinese && lhs.english == rhs.english &&
           lhs.number == rhs.number && lhs.symbol == rhs.symbol &&
           lhs.other == rhs.other && lhs.total == rhs.total;
}

inline bool operator!=(const CounterSet& lhs, const CounterSet& rhs) {
    return !(lhs == rhs);
}

[[nodiscard]] std::string describe(const CounterSet& counters);

}  // namespace dic::stats
