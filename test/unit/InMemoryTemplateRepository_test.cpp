#include "styleverify/repository/InMemoryTemplateRepository.hpp"
#include "StyleTestHelpers.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace styleverify;
using namespace styleverify::core;
using styleverify::repository::InMemoryTemplateRepository;
using styleverify::repository::ResultFilter;

class InMemoryTemplateRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Template tmpl = test::makeTemplate("Report", {test::makeContext(0, "Normal", "p1"),
                                                      test::makeContext(0, "Heading 1", "p2", "Heading1")});
        tmpl.id = 0;
        tmpl.file_hash = "abcd1234";
        auto id = repo_.addTemplate(tmpl);
        ASSERT_TRUE(id);
        template_id_ = *id;
    }

    VerificationResult finishedResult(const std::string& document, size_t mismatches) {
        VerificationResult result;
        result.template_id = template_id_;
        result.document_name = document;
        result.start();
        std::vector<Mismatch> list(mismatches);
        result.complete(std::move(list));
        return result;
    }

    InMemoryTemplateRepository repo_;
    int template_id_ = 0;
};

TEST_F(InMemoryTemplateRepositoryTest, AddAssignsIds) {
    auto tmpl = repo_.getTemplate(template_id_);
    ASSERT_TRUE(tmpl);
    EXPECT_EQ(tmpl->id, template_id_);
    ASSERT_EQ(tmpl->text_styles.size(), 2u);
    EXPECT_GT(tmpl->text_styles[0].id, 0);
    EXPECT_EQ(tmpl->text_styles[1].id, tmpl->text_styles[0].id + 1);
    EXPECT_EQ(tmpl->text_styles[0].template_id, template_id_);
}

TEST_F(InMemoryTemplateRepositoryTest, RejectsDuplicatesAndEmptyNames) {
    Template same_name = test::makeTemplate("Report", {});
    same_name.file_hash = "other";
    EXPECT_EQ(repo_.addTemplate(same_name).error().code, ErrorCode::DuplicateTemplate);

    Template same_hash = test::makeTemplate("Letter", {});
    same_hash.file_hash = "abcd1234";
    EXPECT_EQ(repo_.addTemplate(same_hash).error().code, ErrorCode::DuplicateTemplate);

    EXPECT_EQ(repo_.addTemplate(test::makeTemplate("", {})).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(repo_.getTemplateCount(), 1u);
}

TEST_F(InMemoryTemplateRepositoryTest, LoadActiveTemplate) {
    EXPECT_TRUE(repo_.loadActiveTemplate("Report"));
    EXPECT_EQ(repo_.loadActiveTemplate("Missing").error().code, ErrorCode::TemplateNotFound);

    ASSERT_TRUE(repo_.setTemplateStatus(template_id_, TemplateStatus::Archived, "admin"));
    EXPECT_EQ(repo_.loadActiveTemplate("Report").error().code, ErrorCode::TemplateInactive);
    EXPECT_TRUE(repo_.findTemplateByName("Report"));
}

TEST_F(InMemoryTemplateRepositoryTest, UpdateTemplate) {
    auto tmpl = repo_.getTemplate(template_id_);
    ASSERT_TRUE(tmpl);
    Template updated = *tmpl;
    updated.version = 2;
    updated.text_styles.push_back(test::makeContext(0, "Caption", "p3", "Caption"));
    ASSERT_TRUE(repo_.updateTemplate(updated));

    auto reloaded = repo_.getTemplate(template_id_);
    EXPECT_EQ(reloaded->version, 2);
    EXPECT_GT(reloaded->text_styles.back().id, reloaded->text_styles[1].id);

    Template unknown = updated;
    unknown.id = 999;
    EXPECT_EQ(repo_.updateTemplate(unknown).error().code, ErrorCode::TemplateNotFound);
}

TEST_F(InMemoryTemplateRepositoryTest, StyleDetailsFilterByType) {
    Template tmpl = repo_.getTemplate(template_id_).value();
    tmpl.text_styles[1].style_type = StyleType::Character;

    DefaultStyle normal;
    normal.style_id = "Normal";
    normal.name = "Normal";
    DefaultStyle strong;
    strong.style_id = "Strong";
    strong.name = "Strong";
    strong.type = StyleType::Character;
    tmpl.default_styles = {normal, strong};

    NumberingDefinition bullets;
    bullets.abstract_num_id = 2;
    bullets.type = "Bullet";
    tmpl.numbering_definitions = {bullets};
    ASSERT_TRUE(repo_.updateTemplate(tmpl));

    auto all = repo_.getTemplateStyleDetails(template_id_);
    ASSERT_TRUE(all);
    EXPECT_EQ(all->template_name, "Report");
    EXPECT_EQ(all->totalStyles(), 2u);
    EXPECT_EQ(all->totalDefaultStyles(), 2u);
    EXPECT_EQ(all->totalNumberingDefinitions(), 1u);

    auto characters = repo_.getTemplateStyleDetails(template_id_, StyleType::Character);
    ASSERT_TRUE(characters);
    ASSERT_EQ(characters->totalStyles(), 1u);
    EXPECT_EQ(characters->text_styles[0].name, "Heading 1");
    ASSERT_EQ(characters->totalDefaultStyles(), 1u);
    EXPECT_EQ(characters->default_styles[0].style_id, "Strong");
    EXPECT_EQ(characters->totalNumberingDefinitions(), 1u);

    EXPECT_EQ(repo_.getTemplateStyleDetails(999).error().code, ErrorCode::TemplateNotFound);
}

TEST_F(InMemoryTemplateRepositoryTest, SaveAssignsResultAndMismatchIds) {
    auto first = repo_.saveVerificationResult(finishedResult("a.docx", 2));
    auto second = repo_.saveVerificationResult(finishedResult("b.docx", 1));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(*first, *second);

    auto loaded = repo_.getVerificationResult(*second);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->id, *second);
    EXPECT_EQ(loaded->getMismatches()[0].id, 3);
}

TEST_F(InMemoryTemplateRepositoryTest, SaveRejectsRunningResultsAndUnknownTemplates) {
    VerificationResult running;
    running.template_id = template_id_;
    running.start();
    EXPECT_EQ(repo_.saveVerificationResult(running).error().code, ErrorCode::InvalidStateTransition);

    VerificationResult orphan = finishedResult("x.docx", 0);
    orphan.template_id = 42;
    EXPECT_EQ(repo_.saveVerificationResult(orphan).error().code, ErrorCode::TemplateNotFound);
}

TEST_F(InMemoryTemplateRepositoryTest, DeleteIsRestrictedWhileReferenced) {
    auto saved = repo_.saveVerificationResult(finishedResult("a.docx", 0));
    ASSERT_TRUE(saved);
    EXPECT_EQ(repo_.deleteTemplate(template_id_).error().code, ErrorCode::TemplateInUse);

    ASSERT_TRUE(repo_.deleteVerificationResult(*saved));
    EXPECT_EQ(repo_.getVerificationResult(*saved).error().code, ErrorCode::ResultNotFound);
    EXPECT_TRUE(repo_.deleteTemplate(template_id_));
    EXPECT_EQ(repo_.getTemplateCount(), 0u);
}

TEST_F(InMemoryTemplateRepositoryTest, ListWithFilter) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(repo_.saveVerificationResult(finishedResult(i % 2 ? "odd.docx" : "even.docx", 0)));
    }

    ResultFilter by_name;
    by_name.document_name = "even.docx";
    EXPECT_EQ(repo_.listVerificationResults(by_name).size(), 3u);

    ResultFilter paged;
    paged.offset = 1;
    paged.limit = 2;
    auto page = repo_.listVerificationResults(paged);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].document_name, "odd.docx");

    ResultFilter failed;
    failed.status = VerificationStatus::Failed;
    EXPECT_TRUE(repo_.listVerificationResults(failed).empty());
}

TEST_F(InMemoryTemplateRepositoryTest, ConcurrentSaves) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 25; ++i) {
                auto id = repo_.saveVerificationResult(finishedResult("c.docx", 1));
                EXPECT_TRUE(id);
            }
        });
    }
    for (auto& thread : threads) thread.join();
    EXPECT_EQ(repo_.getResultCount(), 100u);
}
