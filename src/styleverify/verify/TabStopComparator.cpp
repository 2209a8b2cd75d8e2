#include "styleverify/verify/TabStopComparator.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace styleverify {
namespace verify {

namespace {

std::string describeSequence(const std::vector<core::TabStop>& stops) {
    std::string text = "[";
    for (size_t i = 0; i < stops.size(); ++i) {
        if (i > 0) text += ", ";
        text += stops[i].describe();
    }
    text += "]";
    return text;
}

} // anonymous namespace

TabStopComparator::TabStopComparator(double tolerance)
    : tolerance_(tolerance) {
}

std::vector<FieldMismatch> TabStopComparator::compare(const core::TextStyle& expected,
                                                      const core::TextStyle& actual) const {
    std::vector<FieldMismatch> mismatches;
    const auto& lhs = expected.tab_stops;
    const auto& rhs = actual.tab_stops;

    if (lhs.size() != rhs.size()) {
        mismatches.push_back({"TabStopCountMismatch",
                              fmt::format("{} {}", lhs.size(), describeSequence(lhs)),
                              fmt::format("{} {}", rhs.size(), describeSequence(rhs)),
                              ""});
    }

    const size_t common = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < common; ++i) {
        const auto& a = lhs[i];
        const auto& b = rhs[i];
        const bool same = std::fabs(a.position - b.position) <= tolerance_ + 1e-9 &&
                          a.alignment == b.alignment &&
                          a.leader == b.leader;
        if (!same) {
            mismatches.push_back({fmt::format("TabStopMismatch[{}]", i),
                                  a.describe(), b.describe(), ""});
        }
    }

    return mismatches;
}

}} // namespace styleverify::verify
