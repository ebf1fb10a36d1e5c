#include "artifact.hpp"
#include "backup.hpp"
#include "notification.hpp"
#include "test_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

/**
 * @brief Stage with scripted behaviour that records every call.
 */
class FakeStage : public BackupStage
{
  public:
    enum class Mode
    {
        Succeed,
        Fail,
        Throw
    };

    struct Calls
    {
        std::vector<std::string> siteIds;
        std::vector<std::string> timestamps;
    };

    FakeStage(std::string name, Mode mode, std::shared_ptr<Calls> calls)
        : name_(std::move(name)), mode_(mode), calls_(std::move(calls))
    {
    }

    std::string name() const override { return name_; }

    StageOutcome run(const Site& site, const BackupContext& context) override
    {
        calls_->siteIds.push_back(site.id);
        calls_->timestamps.push_back(context.timestamp);
        switch (mode_)
        {
        case Mode::Succeed:
            return StageOutcome::success(name_ + " ok",
                                         BackupArtifact{context.destination / (site.id + "_" + name_), ArtifactKind::Archive,
                                                        context.timestamp});
        case Mode::Fail:
            return StageOutcome::failure(name_ + " failed");
        case Mode::Throw:
            throw std::runtime_error(name_ + " exploded");
        }
        return StageOutcome::failure("unreachable");
    }

  private:
    std::string name_;
    Mode mode_;
    std::shared_ptr<Calls> calls_;
};

StageOutcome Ok()
{
    return StageOutcome::success("ok", BackupArtifact{"x", ArtifactKind::Archive, "ts"});
}

StageOutcome Failed()
{
    return StageOutcome::failure("failed");
}

} // namespace

class OrchestratorTest : public ::testing::Test
{
  protected:
    TempDir tmp;
    SiteVaultConfig config = MakeTestConfig(tmp.path());
    fs::path destination = tmp.path() / "backups";
    std::shared_ptr<FakeStage::Calls> archiveCalls = std::make_shared<FakeStage::Calls>();
    std::shared_ptr<FakeStage::Calls> databaseCalls = std::make_shared<FakeStage::Calls>();
    std::shared_ptr<FakeStage::Calls> snapshotCalls = std::make_shared<FakeStage::Calls>();

    BackupOrchestrator MakeOrchestrator(FakeStage::Mode archive,
                                        FakeStage::Mode database,
                                        FakeStage::Mode snapshot,
                                        BackupOrchestrator::Clock clock = [] { return std::chrono::system_clock::now(); })
    {
        return BackupOrchestrator(config,
                                  std::make_unique<FakeStage>("archive", archive, archiveCalls),
                                  std::make_unique<FakeStage>("database", database, databaseCalls),
                                  std::make_unique<FakeStage>("snapshot", snapshot, snapshotCalls),
                                  std::move(clock));
    }

    static Site MakeSite(const std::string& id) { return Site{id, "/nonexistent/" + id, std::nullopt}; }
};

TEST(ClassifyOutcomeTest, PrecedenceTable)
{
    EXPECT_EQ(classifyOutcome(Ok(), Ok(), Ok()), AggregateStatus::CompleteSuccess);
    EXPECT_EQ(classifyOutcome(Ok(), Ok(), Failed()), AggregateStatus::PartialFilesOk);
    EXPECT_EQ(classifyOutcome(Ok(), Failed(), Ok()), AggregateStatus::PartialFilesOk);
    EXPECT_EQ(classifyOutcome(Ok(), Failed(), Failed()), AggregateStatus::PartialFilesOk);
    EXPECT_EQ(classifyOutcome(Failed(), Ok(), Ok()), AggregateStatus::PartialDatabaseOk);
    EXPECT_EQ(classifyOutcome(Failed(), Ok(), Failed()), AggregateStatus::PartialDatabaseOk);
    EXPECT_EQ(classifyOutcome(Failed(), Failed(), Ok()), AggregateStatus::TotalFailure);
    EXPECT_EQ(classifyOutcome(Failed(), Failed(), Failed()), AggregateStatus::TotalFailure);
}

TEST(ClassifyOutcomeTest, Descriptions)
{
    EXPECT_STREQ(describe(AggregateStatus::CompleteSuccess), "complete success");
    EXPECT_STREQ(describe(AggregateStatus::PartialFilesOk), "partial: files ok, database/config failed");
    EXPECT_STREQ(describe(AggregateStatus::PartialDatabaseOk), "partial: database ok, files failed");
    EXPECT_STREQ(describe(AggregateStatus::TotalFailure), "total failure");
}

TEST_F(OrchestratorTest, FailedStageDoesNotSkipLaterStages)
{
    auto orchestrator = MakeOrchestrator(FakeStage::Mode::Fail, FakeStage::Mode::Fail, FakeStage::Mode::Succeed);

    auto result = orchestrator.backupSite(MakeSite("blog"), destination);

    EXPECT_EQ(archiveCalls->siteIds.size(), 1u);
    EXPECT_EQ(databaseCalls->siteIds.size(), 1u);
    EXPECT_EQ(snapshotCalls->siteIds.size(), 1u);
    EXPECT_EQ(result.status, AggregateStatus::TotalFailure);
    EXPECT_EQ(result.state, SiteBackupState::Reported);
    EXPECT_EQ(result.artifacts().size(), 1u);
}

TEST_F(OrchestratorTest, ThrowingStageBecomesFailure)
{
    auto orchestrator = MakeOrchestrator(FakeStage::Mode::Throw, FakeStage::Mode::Succeed, FakeStage::Mode::Succeed);

    auto result = orchestrator.backupSite(MakeSite("blog"), destination);

    EXPECT_FALSE(result.archive.ok());
    EXPECT_THAT(result.archive.message, HasSubstr("archive exploded"));
    EXPECT_EQ(databaseCalls->siteIds.size(), 1u);
    EXPECT_EQ(snapshotCalls->siteIds.size(), 1u);
    EXPECT_EQ(result.status, AggregateStatus::PartialDatabaseOk);
}

TEST_F(OrchestratorTest, AllStagesShareOneTimestamp)
{
    auto pinned = LocalTime(2025, 6, 8, 14, 3, 9);
    auto orchestrator = MakeOrchestrator(FakeStage::Mode::Succeed, FakeStage::Mode::Succeed, FakeStage::Mode::Succeed,
                                         [pinned] { return pinned; });

    auto result = orchestrator.backupSite(MakeSite("blog"), destination);

    EXPECT_EQ(result.status, AggregateStatus::CompleteSuccess);
    EXPECT_THAT(archiveCalls->timestamps, ElementsAre("08-06-2025_14-03-09"));
    EXPECT_THAT(databaseCalls->timestamps, ElementsAre("08-06-2025_14-03-09"));
    EXPECT_THAT(snapshotCalls->timestamps, ElementsAre("08-06-2025_14-03-09"));
    EXPECT_EQ(result.artifacts().size(), 3u);
}

TEST_F(OrchestratorTest, TotalFailureDoesNotStopRemainingSites)
{
    auto orchestrator = MakeOrchestrator(FakeStage::Mode::Fail, FakeStage::Mode::Fail, FakeStage::Mode::Fail);

    auto summary = orchestrator.run({MakeSite("alpha"), MakeSite("beta"), MakeSite("gamma")}, destination);

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    ASSERT_EQ(summary->results.size(), 3u);
    EXPECT_FALSE(summary->interrupted);
    EXPECT_THAT(archiveCalls->siteIds, ElementsAre("alpha", "beta", "gamma"));
    EXPECT_THAT(snapshotCalls->siteIds, ElementsAre("alpha", "beta", "gamma"));
    for (const auto& result : summary->results)
    {
        EXPECT_EQ(result.status, AggregateStatus::TotalFailure);
    }
}

TEST_F(OrchestratorTest, ShutdownFlagStopsBeforeNextSite)
{
    auto orchestrator = MakeOrchestrator(FakeStage::Mode::Succeed, FakeStage::Mode::Succeed, FakeStage::Mode::Succeed);
    gShutdownFlag = 1;

    auto summary = orchestrator.run({MakeSite("alpha"), MakeSite("beta")}, destination);
    gShutdownFlag = 0;

    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary->interrupted);
    EXPECT_TRUE(summary->results.empty());
    EXPECT_TRUE(archiveCalls->siteIds.empty());
}

TEST_F(OrchestratorTest, PrepareDestinationIsIdempotent)
{
    auto orchestrator = MakeOrchestrator(FakeStage::Mode::Succeed, FakeStage::Mode::Succeed, FakeStage::Mode::Succeed);
    fs::path nested = tmp.path() / "a" / "b" / "backups";

    ASSERT_TRUE(orchestrator.prepareDestination(nested).has_value());
    WriteFile(nested / "earlier.tar.gz", "keep");
    ASSERT_TRUE(orchestrator.prepareDestination(nested).has_value());

    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_EQ(ReadFile(nested / "earlier.tar.gz"), "keep");
}

TEST_F(OrchestratorTest, FileAtDestinationIsUnavailable)
{
    auto orchestrator = MakeOrchestrator(FakeStage::Mode::Succeed, FakeStage::Mode::Succeed, FakeStage::Mode::Succeed);
    WriteFile(destination, "not a directory");

    auto summary = orchestrator.run({MakeSite("blog")}, destination);

    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, BackupErrorCode::DestinationUnavailable);
    EXPECT_TRUE(archiveCalls->siteIds.empty());
}

TEST(RunSummaryTextTest, OneLinePerSite)
{
    RunSummary summary;
    summary.destination = "/backups";
    SiteBackupResult blog;
    blog.siteId = "blog";
    blog.status = AggregateStatus::CompleteSuccess;
    SiteBackupResult shop;
    shop.siteId = "shop";
    shop.status = AggregateStatus::PartialFilesOk;
    summary.results = {blog, shop};

    EXPECT_EQ(formatRunSummary(summary),
              "SiteVault backup to /backups\n"
              "blog: complete success\n"
              "shop: partial: files ok, database/config failed");
}
