#include "styleverify/core/FormattingContext.hpp"
#include "styleverify/utils/StringUtils.hpp"
#include <fmt/format.h>
#include <vector>

namespace styleverify {
namespace core {

std::string FormattingContext::location() const {
    std::vector<std::string> parts;
    if (section_index >= 0)   parts.push_back(fmt::format("Section {}", section_index + 1));
    if (table_index >= 0)     parts.push_back(fmt::format("Table {}", table_index + 1));
    if (row_index >= 0)       parts.push_back(fmt::format("Row {}", row_index + 1));
    if (cell_index >= 0)      parts.push_back(fmt::format("Cell {}", cell_index + 1));
    if (paragraph_index >= 0) parts.push_back(fmt::format("Paragraph {}", paragraph_index + 1));
    if (run_index >= 0)       parts.push_back(fmt::format("Run {}", run_index + 1));

    if (parts.empty()) {
        std::string text = context_key;
        std::string result;
        for (const auto& piece : utils::StringUtils::split(text, ':')) {
            if (!result.empty()) result += " > ";
            result += piece;
        }
        return result;
    }
    return utils::StringUtils::join(parts, ", ");
}

bool FormattingContext::isHeading() const {
    return utils::StringUtils::startsWithIgnoreCase(structural_role, "Heading");
}

}} // namespace styleverify::core
