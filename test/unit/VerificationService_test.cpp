#include "styleverify/core/Exception.hpp"
#include "styleverify/repository/InMemoryTemplateRepository.hpp"
#include "styleverify/service/TemplateRegistrar.hpp"
#include "styleverify/service/VerificationService.hpp"
#include "StyleTestHelpers.hpp"
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

using namespace styleverify;
using namespace styleverify::core;

namespace {

// 以文件内容为键返回预置的上下文
class FakeExtractor : public reader::IContextExtractor {
public:
    void add(const std::string& content, DocumentContexts contexts) {
        documents_[content] = std::move(contexts);
    }

    Result<DocumentContexts> extractContexts(const std::vector<uint8_t>& bytes,
                                             const std::string& document_name) const override {
        auto it = documents_.find(std::string(bytes.begin(), bytes.end()));
        if (it == documents_.end()) {
            return makeError(ErrorCode::ExtractionFailed, "not a document", document_name);
        }
        return it->second;
    }

private:
    std::map<std::string, DocumentContexts> documents_;
};

class ThrowingComparator : public verify::IDimensionComparator {
public:
    const char* name() const override { return "ThrowingComparator"; }
    MismatchCategory category() const override { return MismatchCategory::Style; }
    std::vector<verify::FieldMismatch> compare(const TextStyle&, const TextStyle&) const override {
        throw std::runtime_error("defect");
    }
};

std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

class VerificationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<repository::InMemoryTemplateRepository>();
        extractor_ = std::make_shared<FakeExtractor>();

        extractor_->add("template-v1", {
            test::makeContext(0, "Heading 1", "p1", "Heading1", {{PropertyKey::Color, "000000"}}),
            test::makeContext(0, "Normal", "p2")});
        extractor_->add("template-v2", {
            test::makeContext(0, "Heading 1", "p1", "Heading1", {{PropertyKey::Color, "FF0000"}}),
            test::makeContext(0, "Normal", "p2")});
        extractor_->add("good", {
            test::makeContext(0, "Heading 1", "p1", "Heading1", {{PropertyKey::Color, "000000"}}),
            test::makeContext(0, "Normal", "p2")});
        extractor_->add("bad", {
            test::makeContext(0, "Heading 1", "p1", "Heading1", {{PropertyKey::Color, "FF0000"}}),
            test::makeContext(0, "Normal", "p2", "Body", {{PropertyKey::FontSize, "20"}})});

        verify::VerificationOptions options;
        options.parallel = false;
        registrar_ = std::make_unique<service::TemplateRegistrar>(repository_, extractor_);
        service_ = std::make_unique<service::VerificationService>(repository_, extractor_, options);

        auto id = registrar_->registerTemplate("Report", "report.docx", bytesOf("template-v1"), "tester");
        ASSERT_TRUE(id);
        template_id_ = *id;
    }

    std::shared_ptr<repository::InMemoryTemplateRepository> repository_;
    std::shared_ptr<FakeExtractor> extractor_;
    std::unique_ptr<service::TemplateRegistrar> registrar_;
    std::unique_ptr<service::VerificationService> service_;
    int template_id_ = 0;
};

TEST_F(VerificationServiceTest, ConformingDocument) {
    auto result = service_->verify("Report", "good.docx", bytesOf("good"), "alice");
    ASSERT_TRUE(result);
    EXPECT_GT(result->id, 0);
    EXPECT_EQ(result->getStatus(), VerificationStatus::Completed);
    EXPECT_EQ(result->getTotalMismatches(), 0u);
    EXPECT_EQ(result->template_id, template_id_);
    EXPECT_EQ(result->audit.created_by, "alice");
}

TEST_F(VerificationServiceTest, MismatchesArePersistedWithIds) {
    auto result = service_->verify("Report", "bad.docx", bytesOf("bad"), "alice");
    ASSERT_TRUE(result);
    ASSERT_EQ(result->getTotalMismatches(), 2u);
    EXPECT_EQ(result->getMismatches()[0].context_key, "p1");
    EXPECT_GT(result->getMismatches()[0].id, 0);

    auto stored = service_->getVerificationResult(result->id);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->getTotalMismatches(), 2u);
}

TEST_F(VerificationServiceTest, UnknownOrInactiveTemplateIsAnError) {
    auto missing = service_->verify("Nope", "good.docx", bytesOf("good"), "alice");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::TemplateNotFound);

    ASSERT_TRUE(repository_->setTemplateStatus(template_id_, TemplateStatus::Inactive, "admin"));
    auto inactive = service_->verify("Report", "good.docx", bytesOf("good"), "alice");
    ASSERT_FALSE(inactive);
    EXPECT_EQ(inactive.error().code, ErrorCode::TemplateInactive);
    EXPECT_EQ(repository_->getResultCount(), 0u);
}

TEST_F(VerificationServiceTest, ExtractionFailureIsPersistedAsFailed) {
    auto result = service_->verify("Report", "broken.docx", bytesOf("garbage"), "alice");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->getStatus(), VerificationStatus::Failed);
    EXPECT_EQ(result->getErrorCode(), ErrorCode::ExtractionFailed);
    EXPECT_EQ(result->getErrorMessage(), "not a document");
    EXPECT_EQ(repository_->getResultCount(), 1u);
}

TEST_F(VerificationServiceTest, ComparatorDefectPropagates) {
    verify::VerificationOptions options;
    options.parallel = false;
    service::VerificationService service(repository_, extractor_, options);
    service.engine().addComparator(std::make_unique<ThrowingComparator>());
    EXPECT_THROW(service.verify("Report", "good.docx", bytesOf("good"), "alice"), ComparatorException);
    EXPECT_EQ(repository_->getResultCount(), 0u);
}

TEST_F(VerificationServiceTest, ListDeleteAndSummarize) {
    ASSERT_TRUE(service_->verify("Report", "good.docx", bytesOf("good"), "alice"));
    ASSERT_TRUE(service_->verify("Report", "bad.docx", bytesOf("bad"), "alice"));
    auto failed = service_->verify("Report", "broken.docx", bytesOf("garbage"), "alice");
    ASSERT_TRUE(failed);

    EXPECT_EQ(service_->listResults().size(), 3u);

    auto summary = service_->summarize(template_id_);
    EXPECT_EQ(summary.total_results, 3u);
    EXPECT_EQ(summary.countOf(VerificationStatus::Completed), 2u);
    EXPECT_EQ(summary.countOf(VerificationStatus::Failed), 1u);
    EXPECT_EQ(summary.total_mismatches, 2u);
    EXPECT_EQ(summary.countOf(Severity::High), 2u);
    EXPECT_EQ(summary.countOf(Severity::Low), 0u);

    ASSERT_TRUE(service_->deleteResult(failed->id));
    EXPECT_EQ(service_->deleteResult(failed->id).error().code, ErrorCode::ResultNotFound);
    EXPECT_EQ(service_->summarize().total_results, 2u);
    EXPECT_EQ(service_->summarize(template_id_ + 100).total_results, 0u);
}

TEST_F(VerificationServiceTest, RefreshBumpsVersionOnlyWhenHashChanges) {
    auto same = registrar_->refreshTemplate("Report", bytesOf("template-v1"), "bob");
    ASSERT_TRUE(same);
    EXPECT_EQ(same->version, 1);

    auto changed = registrar_->refreshTemplate("Report", bytesOf("template-v2"), "bob");
    ASSERT_TRUE(changed);
    EXPECT_EQ(changed->version, 2);
    EXPECT_EQ(changed->audit.modified_by, "bob");
    EXPECT_NE(changed->file_hash, same->file_hash);

    // 新版本模板要求红色标题
    auto result = service_->verify("Report", "bad.docx", bytesOf("bad"), "alice");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->template_version, 2);
    EXPECT_EQ(result->getTotalMismatches(), 1u);
}

TEST_F(VerificationServiceTest, RegistrarRejectsDuplicatesAndBadFiles) {
    auto duplicate = registrar_->registerTemplate("Copy", "copy.docx", bytesOf("template-v1"), "tester");
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::DuplicateTemplate);

    auto broken = registrar_->registerTemplate("Broken", "broken.docx", bytesOf("garbage"), "tester");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, ErrorCode::ExtractionFailed);
}

TEST_F(VerificationServiceTest, FileHashIsCrc32) {
    // CRC-32 of "123456789"
    EXPECT_EQ(service::TemplateRegistrar::computeFileHash(bytesOf("123456789")), "cbf43926");
    EXPECT_EQ(service::TemplateRegistrar::computeFileHash({}), "00000000");
}

TEST_F(VerificationServiceTest, NullCollaboratorsRejected) {
    EXPECT_THROW(service::VerificationService(nullptr, extractor_), ParameterException);
    EXPECT_THROW(service::TemplateRegistrar(repository_, nullptr), ParameterException);
}
