#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>

namespace styleverify {
namespace utils {

/**
 * @brief 字符串工具类 - 样式值规范化常用的辅助函数
 */
class StringUtils {
public:
    /**
     * @brief 去除首尾空白
     */
    static std::string trim(std::string_view str) {
        size_t start = str.find_first_not_of(" \t\n\r");
        if (start == std::string_view::npos) {
            return std::string();
        }
        size_t end = str.find_last_not_of(" \t\n\r");
        return std::string(str.substr(start, end - start + 1));
    }

    static std::string toLower(std::string_view str) {
        std::string result(str);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    static std::string toUpper(std::string_view str) {
        std::string result(str);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    static bool startsWithIgnoreCase(std::string_view str, std::string_view prefix) {
        return str.size() >= prefix.size() && equalsIgnoreCase(str.substr(0, prefix.size()), prefix);
    }

    /**
     * @brief 按分隔符拼接
     */
    static std::string join(const std::vector<std::string>& parts, std::string_view separator) {
        std::string result;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result.append(separator);
            result.append(parts[i]);
        }
        return result;
    }

    /**
     * @brief 按单个字符拆分，保留空段
     */
    static std::vector<std::string> split(std::string_view str, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t pos = str.find(delimiter, start);
            if (pos == std::string_view::npos) {
                parts.emplace_back(str.substr(start));
                break;
            }
            parts.emplace_back(str.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    /**
     * @brief 截断到指定长度（按字节，不拆分UTF-8多字节序列）
     */
    static std::string truncateUtf8(const std::string& str, size_t max_bytes) {
        if (str.size() <= max_bytes) return str;
        size_t cut = max_bytes;
        while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        return str.substr(0, cut);
    }
};

}} // namespace styleverify::utils
