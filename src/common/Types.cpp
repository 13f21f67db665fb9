#include "common/Types.h"

namespace quantpulse {

std::string toString(Trend trend) {
    switch (trend) {
        case Trend::UPTREND: return "uptrend";
        case Trend::DOWNTREND: return "downtrend";
        case Trend::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::string toString(Comparator comparator) {
    switch (comparator) {
        case Comparator::GREATER: return ">";
        case Comparator::LESS: return "<";
        case Comparator::GREATER_EQUAL: return ">=";
        case Comparator::LESS_EQUAL: return "<=";
        case Comparator::EQUAL: return "==";
        case Comparator::NOT_EQUAL: return "!=";
    }
    return ">";
}

std::optional<Comparator> parseComparator(const std::string& symbol) {
    if (symbol == ">") return Comparator::GREATER;
    if (symbol == "<") return Comparator::LESS;
    if (symbol == ">=") return Comparator::GREATER_EQUAL;
    if (symbol == "<=") return Comparator::LESS_EQUAL;
    if (symbol == "==") return Comparator::EQUAL;
    if (symbol == "!=") return Comparator::NOT_EQUAL;
    return std::nullopt;
}

} // namespace quantpulse
