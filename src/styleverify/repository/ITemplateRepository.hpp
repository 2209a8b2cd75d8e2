#pragma once

#include "styleverify/core/Expected.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/Template.hpp"
#include "styleverify/core/VerificationResult.hpp"
#include <optional>
#include <string>
#include <vector>

namespace styleverify {
namespace repository {

/**
 * @brief 校验结果查询条件，未设置的条件不参与过滤
 */
struct ResultFilter {
    std::optional<int> template_id;
    std::optional<core::VerificationStatus> status;
    std::optional<std::string> document_name;
    size_t offset = 0;
    size_t limit = 0;   // 0 表示不限制
};

/**
 * @brief 模板概要，列表接口使用，不含样式
 */
struct TemplateInfo {
    int id = 0;
    std::string name;
    std::string file_name;
    core::TemplateStatus status = core::TemplateStatus::Active;
    int version = 1;
    size_t style_count = 0;
};

/**
 * @brief 模板样式明细：校验用的格式上下文 + 样式目录 + 编号定义
 *
 * 设置 style_type 过滤时，text_styles 与 default_styles 只保留该类型，
 * 编号定义不受过滤影响。
 */
struct TemplateStyleDetails {
    int template_id = 0;
    std::string template_name;
    int version = 1;
    std::vector<core::TextStyle> text_styles;
    std::vector<core::DefaultStyle> default_styles;
    std::vector<core::NumberingDefinition> numbering_definitions;

    size_t totalStyles() const { return text_styles.size(); }
    size_t totalDefaultStyles() const { return default_styles.size(); }
    size_t totalNumberingDefinitions() const { return numbering_definitions.size(); }
};

/**
 * @brief 模板与校验结果的存储接口
 *
 * 返回的模板与结果都是值快照，调用方修改不影响存储。
 * 删除模板是 Restrict 语义：仍有校验结果引用时返回 TemplateInUse。
 * 删除校验结果时其不一致项一并删除。
 * 实现必须线程安全。
 */
class ITemplateRepository {
public:
    virtual ~ITemplateRepository() = default;

    // ========== 模板 ==========

    /**
     * @brief 新增模板，分配模板与样式编号
     * @return 模板编号；名称或文件哈希重复时 DuplicateTemplate
     */
    virtual core::Result<int> addTemplate(core::Template tmpl) = 0;

    /**
     * @brief 整体替换已有模板（按 id）
     */
    virtual core::VoidResult updateTemplate(core::Template tmpl) = 0;

    virtual core::Result<core::Template> getTemplate(int id) const = 0;
    virtual core::Result<core::Template> findTemplateByName(const std::string& name) const = 0;

    /**
     * @brief 按名称加载激活状态的模板
     * @return TemplateNotFound 或 TemplateInactive
     */
    virtual core::Result<core::Template> loadActiveTemplate(const std::string& name) const = 0;

    virtual std::vector<TemplateInfo> listTemplates() const = 0;

    /**
     * @brief 模板样式明细，可按样式类型过滤
     * @return TemplateNotFound
     */
    virtual core::Result<TemplateStyleDetails> getTemplateStyleDetails(
        int id, std::optional<core::StyleType> style_type = std::nullopt) const = 0;

    virtual core::VoidResult setTemplateStatus(int id, core::TemplateStatus status,
                                               const std::string& modified_by) = 0;

    virtual core::VoidResult deleteTemplate(int id) = 0;

    // ========== 校验结果 ==========

    /**
     * @brief 保存终态结果，分配结果与不一致项编号
     */
    virtual core::Result<int> saveVerificationResult(core::VerificationResult result) = 0;

    virtual core::Result<core::VerificationResult> getVerificationResult(int id) const = 0;

    virtual std::vector<core::VerificationResult> listVerificationResults(const ResultFilter& filter) const = 0;

    virtual core::VoidResult deleteVerificationResult(int id) = 0;
};

}} // namespace styleverify::repository
