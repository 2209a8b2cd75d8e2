#include "styleverify/core/NumberingDefinition.hpp"
#include <fmt/format.h>
#include <cctype>

namespace styleverify {
namespace core {

std::string numberingTypeFor(const std::string& number_format) {
    if (number_format.empty()) return "Unknown";
    if (number_format == "bullet") return "Bullet";
    if (number_format == "decimal") return "Number";

    std::string type = number_format;
    type[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(type[0])));
    return type;
}

std::string numberingNameFor(const std::string& name, const std::string& style_link, int abstract_num_id) {
    if (!name.empty()) return name;
    if (!style_link.empty()) return style_link;
    return fmt::format("Numbering_{}", abstract_num_id);
}

}} // namespace styleverify::core
