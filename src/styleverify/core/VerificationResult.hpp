#pragma once

#include "styleverify/core/AuditInfo.hpp"
#include "styleverify/core/ErrorCode.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/utils/TimeUtils.hpp"
#include <string>
#include <vector>

namespace styleverify {
namespace core {

/**
 * @brief 一条检测到的不一致项，创建后不可变
 */
struct Mismatch {
    int id = 0;
    std::string context_key;
    std::string location;
    std::string structural_role;
    MismatchCategory category = MismatchCategory::Style;
    std::vector<std::string> fields;    // 已排序、去重
    std::string expected;
    std::string actual;
    std::string sample_text;
    Severity severity = Severity::Medium;
    std::string recommended_action;
    utils::TimeUtils::TimePoint created_on = utils::TimeUtils::now();

    /**
     * @brief 逗号拼接的字段列表
     */
    std::string mismatchFields() const;
};

/**
 * @brief 一次校验运行的结果
 *
 * 状态机: Pending -> Running -> {Completed | Failed}，Pending 也可直接 Failed。
 * 终态不可再修改，非法迁移抛出 StateException。
 * Failed 状态不携带任何不一致项。
 */
class VerificationResult {
public:
    int id = 0;
    int template_id = 0;
    int template_version = 0;
    std::string template_name;
    std::string document_name;
    std::string document_path;
    AuditInfo audit;
    std::vector<std::string> warnings;

    VerificationResult() = default;

    VerificationStatus getStatus() const { return status_; }
    bool isTerminal() const { return core::isTerminal(status_); }

    ErrorCode getErrorCode() const { return error_code_; }
    const std::string& getErrorMessage() const { return error_message_; }

    const std::vector<Mismatch>& getMismatches() const { return mismatches_; }
    size_t getTotalMismatches() const { return mismatches_.size(); }

    utils::TimeUtils::TimePoint getVerificationDate() const { return verification_date_; }

    // ========== 状态迁移 ==========

    /**
     * @brief Pending -> Running
     */
    void start();

    /**
     * @brief Running -> Completed，写入最终的不一致项列表
     */
    void complete(std::vector<Mismatch> mismatches);

    /**
     * @brief Pending/Running -> Failed，丢弃所有不一致项
     */
    void fail(ErrorCode code, const std::string& message);

    /**
     * @brief 仓库持久化时回填不一致项编号
     */
    void assignMismatchIds(int first_id);

private:
    VerificationStatus status_ = VerificationStatus::Pending;
    ErrorCode error_code_ = ErrorCode::Ok;
    std::string error_message_;
    std::vector<Mismatch> mismatches_;
    utils::TimeUtils::TimePoint verification_date_ = utils::TimeUtils::now();
};

/**
 * @brief 按严重程度给出的处理建议
 */
std::string recommendedActionFor(Severity severity);

}} // namespace styleverify::core
