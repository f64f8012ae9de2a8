#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace Handoff {

/**
 * A source number. Integer and real are distinct alternatives, so an integer 5
 * never compares equal to a real 5.0.
 */
using Value = std::variant<int64_t, double>;

using Source = std::vector<Value>;
using Destination = std::vector<std::optional<Value>>;

/**
 * One source element tagged with its position in the source.
 */
struct Item {
    size_t index;
    Value value;
};

/**
 * True when both values hold the same alternative and the same number. Two
 * NaN reals are the same value, so a NaN that went through the channel
 * validates against its source.
 */
bool SameValue(const Value& a, const Value& b);

inline bool operator==(const Item& a, const Item& b) {
    return a.index == b.index && SameValue(a.value, b.value);
}

inline bool operator!=(const Item& a, const Item& b) {
    return !(a == b);
}

/**
 * End-of-stream marker. Carries no payload and shares no representation
 * with Item.
 */
struct EndOfStream {};

inline bool operator==(const EndOfStream&, const EndOfStream&) { return true; }
inline bool operator!=(const EndOfStream&, const EndOfStream&) { return false; }

using ChannelElement = std::variant<Item, EndOfStream>;

inline bool IsEndOfStream(const ChannelElement& element) {
    return std::holds_alternative<EndOfStream>(element);
}

// Integers print as-is, reals with six fractional digits.
std::string FormatValue(const Value& value);
std::string FormatValue(const std::optional<Value>& value);

// "[a, b, c]"
std::string FormatSequence(const Source& values);
std::string FormatSequence(const Destination& values);

std::ostream& operator<<(std::ostream& os, const Item& item);

} // namespace Handoff
