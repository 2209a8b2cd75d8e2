#pragma once

#include "styleverify/core/DefaultStyle.hpp"
#include "styleverify/core/Expected.hpp"
#include "styleverify/core/NumberingDefinition.hpp"
#include "styleverify/core/TextStyle.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace styleverify {
namespace reader {

/**
 * @brief 模板样式目录：声明的样式定义与编号定义
 */
struct TemplateCatalog {
    std::vector<core::DefaultStyle> default_styles;
    std::vector<core::NumberingDefinition> numbering_definitions;
};

/**
 * @brief 格式上下文抽取接口
 *
 * 把文档字节转换为按文档顺序排列的格式上下文。
 * 输入无法解析时返回 ExtractionFailed；可解析但没有任何上下文时返回空列表。
 * 实现必须可被多个线程同时调用。
 */
class IContextExtractor {
public:
    virtual ~IContextExtractor() = default;

    virtual core::Result<core::DocumentContexts> extractContexts(const std::vector<uint8_t>& document_bytes,
                                                                 const std::string& document_name) const = 0;

    /**
     * @brief 抽取样式目录，不支持样式目录的格式返回空目录
     */
    virtual core::Result<TemplateCatalog> extractCatalog(const std::vector<uint8_t>& /*document_bytes*/,
                                                         const std::string& /*document_name*/) const {
        return TemplateCatalog();
    }
};

}} // namespace styleverify::reader
