#include "item.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace Handoff {

namespace {

template<typename Seq>
std::string FormatSequenceImpl(const Seq& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << FormatValue(values[i]);
    }
    oss << "]";
    return oss.str();
}

} // namespace

bool SameValue(const Value& a, const Value& b) {
    if (a.index() != b.index()) {
        return false;
    }
    if (const int64_t* i = std::get_if<int64_t>(&a)) {
        return *i == std::get<int64_t>(b);
    }
    double x = std::get<double>(a);
    double y = std::get<double>(b);
    return x == y || (std::isnan(x) && std::isnan(y));
}

std::string FormatValue(const Value& value) {
    if (const int64_t* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << std::get<double>(value);
    return oss.str();
}

std::string FormatValue(const std::optional<Value>& value) {
    if (!value.has_value()) {
        return "None";
    }
    return FormatValue(*value);
}

std::string FormatSequence(const Source& values) {
    return FormatSequenceImpl(values);
}

std::string FormatSequence(const Destination& values) {
    return FormatSequenceImpl(values);
}

std::ostream& operator<<(std::ostream& os, const Item& item) {
    return os << "{index=" << item.index << ", value=" << FormatValue(item.value) << "}";
}

} // namespace Handoff
