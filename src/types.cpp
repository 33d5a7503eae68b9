#include "daily_input_counter/types.hpp"

#include <sstream>

namespace dic::stats {

const char* categoryName(Category category) noexcept {
    switch (category) {
        case Category::Chinese: return "chinese";
        case Category::English: return "english";
        case Category::Number: return "number";
        case Category::Symbol: return "symbol";
        case Category::Other: return "other";
    }
    return "other";
}

void CounterSet::add(Category category, std::int64_t amount) {
    switch (category) {
        case Category::Chinese: chinese += amount; break;
        case Category::English: english += amount; break;
        case Category::Number: number += amount; break;
        case Category::Symbol: symbol += amount; break;
        case Category::Other: other += amount; break;
    }
    total += amount;
}

CounterSet& CounterSet::operator+=(const CounterSet& rhs) {
    chinese += rhs.chinese;
    english += rhs.english;
    number += rhs.number;
    symbol += rhs.symbol;
    other += rhs.other;
    total += rhs.total;
    return *this;
}

CounterSet& CounterSet::operator-=(const CounterSet& rhs) {
    chinese -= rhs.chinese;
    english -= rhs.english;
    number -= rhs.number;
    symbol -= rhs.symbol;
    other -= rhs.other;
    total -= rhs.total;
    return *this;
}

std::string describe(const CounterSet& counters) {
    std::ostringstream oss;
    oss << "chinese=" << counters.chinese
        << " english=" << counters.english
        << " number=" << counters.number
        << " symbol=" << counters.symbol
        << " other=" << counters.other
        << " total=" << counters.total;
    return oss.str();
}

}  // namespace dic::stats
