#include <catch2/catch_test_macros.hpp>

#include "protocol/ledger.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace protocol;
using namespace test_helpers;

namespace {

struct LedgerFixture {
    PlatformConfig          config;
    AuditLog                audit;
    crypto::RevealOracle    oracle{32, 12};
    ElGamalRevealCapability capability{oracle};
    FixedBeacon             beacon;
    ObfuscationGenerator    obfuscation{config, capability, beacon};
    CampaignLedger          ledger{config, capability, obfuscation, audit};

    CampaignMetadata meta(const std::string& title = "Community garden") {
        CampaignMetadata m;
        m.title = title;
        m.description = "Raised beds";
        m.category = "garden";
        m.content_ref = "QmGarden";
        return m;
    }

    // Decrypt through the oracle, the way tests stand in for a harness decrypt
    Amount open(const Ciphertext& ct) {
        RequestId id = capability.request_reveal({ct}, Bytes{});
        crypto::RevealResponse r = oracle.fulfill(id);
        return crypto::decode_plaintexts(r.plaintexts, 1)[0];
    }
};

} // namespace

TEST_CASE("Campaign creation", "[ledger]") {
    LedgerFixture f;

    SECTION("creates an active campaign with encrypted target and zero total") {
        CampaignId id = f.ledger.create_campaign("alice", f.meta(), 1000, 30 * DAY, T0);
        REQUIRE(id == 1);

        const Campaign& c = f.ledger.campaign(id);
        REQUIRE(c.status == CampaignStatus::Active);
        REQUIRE(c.creator == "alice");
        REQUIRE(c.deadline == T0 + 30 * DAY);
        REQUIRE(f.open(c.target) == 1000);
        REQUIRE(f.open(c.raised) == 0);
        REQUIRE(c.multiplier >= f.config.multiplier_min);
        REQUIRE(c.multiplier < f.config.multiplier_max);
        REQUIRE(f.open(c.obfuscated_target) == 1000 * c.multiplier);

        REQUIRE(f.ledger.stats().total == 1);
        REQUIRE(f.ledger.stats().active == 1);
        REQUIRE(f.ledger.creator_campaigns("alice") == std::vector<CampaignId>{1});
        REQUIRE(f.audit.campaign_events().size() == 1);
        REQUIRE(f.audit.campaign_events()[0].operation == "create");
    }

    SECTION("identifiers are monotonic") {
        CampaignId a = f.ledger.create_campaign("alice", f.meta(), 1000, 30 * DAY, T0);
        CampaignId b = f.ledger.create_campaign("bob", f.meta(), 1000, 30 * DAY, T0);
        REQUIRE(b == a + 1);
        REQUIRE(f.ledger.campaign_count() == 2);
    }

    SECTION("metadata bounds") {
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", f.meta(""), 1000, 30 * DAY, T0),
                          ValidationError);
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", f.meta(std::string(101, 't')), 1000, 30 * DAY, T0),
                          ValidationError);
        REQUIRE_NOTHROW(f.ledger.create_campaign("alice", f.meta(std::string(100, 't')), 1000, 30 * DAY, T0));

        CampaignMetadata m = f.meta();
        m.description = std::string(2001, 'd');
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", m, 1000, 30 * DAY, T0), ValidationError);
        m = f.meta();
        m.category = std::string(51, 'c');
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", m, 1000, 30 * DAY, T0), ValidationError);
        m = f.meta();
        m.content_ref = std::string(129, 'q');
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", m, 1000, 30 * DAY, T0), ValidationError);
    }

    SECTION("duration bounds") {
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", f.meta(), 1000, 7 * DAY - 1, T0), ValidationError);
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", f.meta(), 1000, 90 * DAY + 1, T0), ValidationError);
        REQUIRE_NOTHROW(f.ledger.create_campaign("alice", f.meta(), 1000, 7 * DAY, T0));
        REQUIRE_NOTHROW(f.ledger.create_campaign("alice", f.meta(), 1000, 90 * DAY, T0));

        const Timestamp late = std::numeric_limits<Timestamp>::max() - 30 * DAY + 1;
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", f.meta(), 1000, 30 * DAY, late),
                          ValidationError);
    }

    SECTION("target bounds") {
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", f.meta(), 0, 30 * DAY, T0), ValidationError);
        REQUIRE_THROWS_AS(f.ledger.create_campaign("alice", f.meta(), f.config.max_target + 1, 30 * DAY, T0),
                          ValidationError);
    }

    SECTION("rejected creation leaves nothing behind") {
        REQUIRE_THROWS(f.ledger.create_campaign("alice", f.meta(), 0, 30 * DAY, T0));
        REQUIRE(f.ledger.campaign_count() == 0);
        REQUIRE(f.ledger.stats().total == 0);
        REQUIRE(f.audit.campaign_events().empty());
        REQUIRE(f.obfuscation.used_count() == 0);
    }

    SECTION("unknown campaign") {
        REQUIRE_THROWS_AS(f.ledger.campaign(99), ValidationError);
    }
}

TEST_CASE("Contributions", "[ledger]") {
    LedgerFixture f;
    CampaignId id = f.ledger.create_campaign("alice", f.meta(), 1000, 30 * DAY, T0);
    const Timestamp deadline = T0 + 30 * DAY;

    SECTION("raised is the homomorphic sum of contributions") {
        f.ledger.record_contribution(id, "bob", 400, "good luck", T0 + 1);
        f.ledger.record_contribution(id, "carol", 400, "", T0 + 2);
        f.ledger.record_contribution(id, "dave", 300, "", T0 + 3);

        const Campaign& c = f.ledger.campaign(id);
        REQUIRE(f.open(c.raised) == 1100);
        REQUIRE(c.backer_count == 3);
        REQUIRE(c.held == 1100);
        REQUIRE(f.ledger.stats().held_balance == 1100);
    }

    SECTION("repeat contributions accumulate without a new backer") {
        f.ledger.record_contribution(id, "bob", 100, "first", T0 + 1);
        f.ledger.record_contribution(id, "bob", 250, "", T0 + 5);

        const Campaign& c = f.ledger.campaign(id);
        REQUIRE(c.backer_count == 1);
        REQUIRE(f.open(c.raised) == 350);

        const Contribution* contrib = f.ledger.find_contribution(id, "bob");
        REQUIRE(contrib != nullptr);
        REQUIRE(f.open(contrib->amount) == 350);
        REQUIRE(contrib->first_contributed_at == T0 + 1);
        REQUIRE(contrib->last_contributed_at == T0 + 5);
        REQUIRE(contrib->message == "first");
        REQUIRE(f.ledger.backer_campaigns("bob") == std::vector<CampaignId>{id});

        auto history = f.audit.contribution_history(id, "bob");
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].kind == ContributionEventKind::Created);
        REQUIRE(history[1].kind == ContributionEventKind::Increased);
    }

    SECTION("deadline boundary") {
        REQUIRE_NOTHROW(f.ledger.record_contribution(id, "bob", 10, "", deadline - 1));
        REQUIRE_THROWS_AS(f.ledger.record_contribution(id, "carol", 10, "", deadline), StateError);
    }

    SECTION("amount and message bounds") {
        REQUIRE_THROWS_AS(f.ledger.record_contribution(id, "bob", 0, "", T0 + 1), ValidationError);
        REQUIRE_THROWS_AS(f.ledger.record_contribution(id, "bob", f.config.max_contribution + 1, "", T0 + 1),
                          ValidationError);
        REQUIRE_THROWS_AS(f.ledger.record_contribution(id, "bob", 10, std::string(281, 'm'), T0 + 1),
                          ValidationError);
        REQUIRE_THROWS_AS(f.ledger.record_contribution(id, "", 10, "", T0 + 1), ValidationError);

        // Nothing was written
        REQUIRE(f.ledger.find_contribution(id, "bob") == nullptr);
        REQUIRE(f.ledger.campaign(id).backer_count == 0);
        REQUIRE(f.ledger.campaign(id).held == 0);
    }

    SECTION("only active, unpaused campaigns accept funds") {
        Campaign& c = f.ledger.campaign(id);
        c.paused = true;
        REQUIRE_THROWS_AS(f.ledger.record_contribution(id, "bob", 10, "", T0 + 1), StateError);
        c.paused = false;

        f.ledger.transition(c, CampaignStatus::DecryptionPending, T0 + 2, "finalize");
        REQUIRE_THROWS_AS(f.ledger.record_contribution(id, "bob", 10, "", T0 + 3), StateError);
    }

    SECTION("unknown campaign") {
        REQUIRE_THROWS_AS(f.ledger.record_contribution(42, "bob", 10, "", T0 + 1), ValidationError);
    }
}

TEST_CASE("Status bookkeeping", "[ledger]") {
    LedgerFixture f;
    CampaignId id = f.ledger.create_campaign("alice", f.meta(), 1000, 30 * DAY, T0);
    Campaign& c = f.ledger.campaign(id);

    SECTION("transition keeps counters in step and audits") {
        f.ledger.transition(c, CampaignStatus::DecryptionPending, T0 + 1, "finalize");
        REQUIRE(f.ledger.stats().active == 0);
        REQUIRE(f.ledger.stats().pending == 1);

        f.ledger.transition(c, CampaignStatus::Failed, T0 + 2, "reveal");
        REQUIRE(f.ledger.stats().pending == 0);
        REQUIRE(f.ledger.stats().failed == 1);
        REQUIRE(f.ledger.stats().total == 1);

        auto history = f.audit.campaign_history(id);
        REQUIRE(history.size() == 3);
        REQUIRE(history[2].from == CampaignStatus::DecryptionPending);
        REQUIRE(history[2].to == CampaignStatus::Failed);
        REQUIRE(history[2].operation == "reveal");
    }

    SECTION("debit refuses to overdraw") {
        f.ledger.record_contribution(id, "bob", 50, "", T0 + 1);
        REQUIRE_THROWS_AS(f.ledger.debit(c, 51), ResourceError);
        f.ledger.debit(c, 50);
        REQUIRE(c.held == 0);
        REQUIRE(f.ledger.stats().held_balance == 0);
    }
}
