#pragma once

#include "styleverify/core/Expected.hpp"
#include "styleverify/core/Template.hpp"
#include "styleverify/reader/IContextExtractor.hpp"
#include "styleverify/repository/ITemplateRepository.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace styleverify {
namespace service {

/**
 * @brief 模板登记 - 从模板文件抽取格式上下文并存入仓库
 *
 * 文件哈希用于变更检测：重新登记时哈希不变则保持原版本，
 * 哈希变化则重新抽取样式与样式目录并将版本号加一。
 */
class TemplateRegistrar {
public:
    TemplateRegistrar(std::shared_ptr<repository::ITemplateRepository> repository,
                      std::shared_ptr<reader::IContextExtractor> extractor);

    /**
     * @brief 登记新模板
     * @return 新模板 id；同名或同哈希模板已存在时返回 DuplicateTemplate
     */
    core::Result<int> registerTemplate(const std::string& name,
                                       const std::string& file_name,
                                       const std::vector<uint8_t>& file_bytes,
                                       const std::string& created_by,
                                       const std::string& description = "");

    /**
     * @brief 用新的文件内容刷新已有模板
     * @return 刷新后的模板（哈希未变时原样返回）
     */
    core::Result<core::Template> refreshTemplate(const std::string& name,
                                                 const std::vector<uint8_t>& file_bytes,
                                                 const std::string& modified_by);

    /**
     * @brief 文件内容哈希（CRC-32，8 位十六进制）
     */
    static std::string computeFileHash(const std::vector<uint8_t>& file_bytes);

private:
    core::Result<std::vector<core::TextStyle>> extractStyles(const std::string& file_name,
                                                             const std::vector<uint8_t>& file_bytes) const;

    /**
     * @brief 抽取上下文与样式目录并写入模板
     */
    core::VoidResult extractInto(core::Template& tmpl, const std::vector<uint8_t>& file_bytes) const;

    std::shared_ptr<repository::ITemplateRepository> repository_;
    std::shared_ptr<reader::IContextExtractor> extractor_;
};

}} // namespace styleverify::service
