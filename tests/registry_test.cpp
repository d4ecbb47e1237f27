// pledge-Prod headers
#include "core/CampaignRegistry.hpp"
#include "core/Errors.hpp"
#include "io/AccountBook.hpp"
#include "io/SequentialIssuer.hpp"

// pledge-Fake headers
#include "ManualClock.hpp"
#include "Mocks.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <set>
#include <thread>

namespace pledge::test {

  using namespace pledge::core;
  using namespace std::chrono_literals;
  using testing::AllOf;
  using testing::Field;

  class CampaignRegistryTest : public ::testing::Test {
  protected:
    void SetUp() override {
      config.duration = 3600s;
      accounts = std::make_shared<io::AccountBook>();
      issuer = std::make_shared<io::SequentialIssuer>();
      logger = std::make_shared<testing::NiceMock<MockLogger>>();

      Collaborators deps;
      deps.issuer = issuer;
      deps.transfer = accounts;
      deps.logger = logger;
      deps.errorMonitor = std::make_shared<ErrorMonitor>();
      deps.clock = clock.source();
      registry = std::make_unique<CampaignRegistry>(config, std::move(deps));
    }

    CampaignConfig config;
    ManualClock clock;
    std::shared_ptr<io::AccountBook> accounts;
    std::shared_ptr<io::SequentialIssuer> issuer;
    std::shared_ptr<testing::NiceMock<MockLogger>> logger;
    std::unique_ptr<CampaignRegistry> registry;
  };

  TEST_F(CampaignRegistryTest, createCampaign_AssignsSequentialIdsAndLogsCreation) {
    EXPECT_CALL(*logger, log(AllOf(Field(&LogEvent::kind, EventKind::Created),
                                   Field(&LogEvent::subject, "olivia"), Field(&LogEvent::amount, 10u))))
        .Times(1);
    EXPECT_CALL(*logger, log(AllOf(Field(&LogEvent::kind, EventKind::Created),
                                   Field(&LogEvent::subject, "oscar"))))
        .Times(1);

    auto first = registry->createCampaign("olivia", 10);
    auto second = registry->createCampaign("oscar", 20);

    EXPECT_EQ(first->id(), 1u);
    EXPECT_EQ(second->id(), 2u);
    EXPECT_EQ(registry->size(), 2u);
    EXPECT_EQ(first->deadline(), clock.now() + 3600s);
  }

  TEST_F(CampaignRegistryTest, createCampaign_RejectsZeroGoalWithoutRegistering) {
    EXPECT_THROW(registry->createCampaign("olivia", 0), ValidationError);
    EXPECT_EQ(registry->size(), 0u);
  }

  TEST_F(CampaignRegistryTest, find_ReturnsNullForUnknownAndAtThrows) {
    auto c = registry->createCampaign("olivia", 10);

    EXPECT_EQ(registry->find(c->id()), c);
    EXPECT_EQ(registry->find(99), nullptr);
    EXPECT_THROW(registry->at(99), std::out_of_range);
  }

  TEST_F(CampaignRegistryTest, campaigns_KeepIndependentState) {
    auto a = registry->createCampaign("olivia", 10);
    auto b = registry->createCampaign("oscar", 10);

    a->contribute("alice", 10);
    b->contribute("alice", 4);

    EXPECT_EQ(a->status(), Status::Closed);
    EXPECT_EQ(b->status(), Status::Active);
    EXPECT_EQ(b->balanceOf("alice"), 4u);

    EXPECT_EQ(a->withdraw("olivia"), 10u);
    EXPECT_THROW(b->withdraw("oscar"), StateError);
    EXPECT_EQ(accounts->balanceOf("olivia"), 10u);
  }

  TEST_F(CampaignRegistryTest, campaigns_RunInParallelWithGloballyUniqueCredentials) {
    constexpr int kCampaigns = 4;
    constexpr int kContributions = 250;

    std::vector<CampaignRegistry::Handle> campaigns;
    for (int i = 0; i < kCampaigns; ++i)
      campaigns.push_back(registry->createCampaign("owner" + std::to_string(i), 1'000'000));

    std::vector<std::thread> workers;
    for (auto& c : campaigns) {
      workers.emplace_back([c] {
        for (int i = 0; i < kContributions; ++i)
          c->contribute("backer", 1);
      });
    }
    for (auto& w : workers)
      w.join();

    std::set<CredentialId> all;
    for (auto& c : campaigns) {
      EXPECT_EQ(c->currentAmount(), static_cast<Amount>(kContributions));
      for (auto id : c->credentialsOf("backer"))
        all.insert(id);
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kCampaigns * kContributions));
    EXPECT_EQ(issuer->issued(), all.size());
  }

} // namespace pledge::test
