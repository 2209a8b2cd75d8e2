#include "styleverify/core/Color.hpp"
#include "styleverify/utils/StringUtils.hpp"
#include <fmt/format.h>
#include <cctype>

namespace styleverify {
namespace core {

const Color Color::BLACK(0x000000);
const Color Color::WHITE(0xFFFFFF);
const Color Color::RED(0xFF0000);
const Color Color::GREEN(0x00FF00);
const Color Color::BLUE(0x0000FF);
const Color Color::YELLOW(0xFFFF00);

namespace {

bool isHexString(const std::string& s) {
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return !s.empty();
}

} // anonymous namespace

std::optional<Color> Color::parse(const std::string& text) {
    std::string value = utils::StringUtils::toLower(utils::StringUtils::trim(text));
    if (value.empty()) {
        return std::nullopt;
    }

    if (value == "auto" || value == "automatic") {
        return Color::automatic();
    }

    if (value == "black") return BLACK;
    if (value == "white") return WHITE;
    if (value == "red") return RED;
    if (value == "green") return GREEN;
    if (value == "blue") return BLUE;
    if (value == "yellow") return YELLOW;

    // 移除#前缀
    if (value[0] == '#') {
        value = value.substr(1);
    }

    if (!isHexString(value)) {
        return std::nullopt;
    }

    if (value.length() == 3) {
        // #RGB 简写
        std::string expanded;
        for (char c : value) {
            expanded.push_back(c);
            expanded.push_back(c);
        }
        value = expanded;
    } else if (value.length() == 8) {
        // ARGB，丢弃alpha
        value = value.substr(2);
    }

    if (value.length() != 6) {
        return std::nullopt;
    }

    return Color(static_cast<uint32_t>(std::stoul(value, nullptr, 16)));
}

std::string Color::toHex(bool include_hash) const {
    return fmt::format("{}{:06X}", include_hash ? "#" : "", getRGB());
}

}} // namespace styleverify::core
