#include <catch2/catch_test_macros.hpp>
#include "sealfund/sealfund_c.h"

#include <cstring>
#include <string>

static const uint64_t DAY = 24 * 60 * 60;
static const uint64_t T0 = 1700000000;

// Platform with a small dlog table, owned by "owner"
static sf_platform_t* make_platform() {
    sf_platform_t* p = nullptr;
    REQUIRE(sf_platform_create("owner", nullptr, 32, &p) == SF_OK);
    REQUIRE(p != nullptr);
    return p;
}

static uint64_t make_campaign(sf_platform_t* p, uint64_t target) {
    uint64_t id = 0;
    REQUIRE(sf_campaign_create(p, "alice", "Bike repair workshop", "Tools and a bench",
                               "community", "QmBikes", target, 30 * DAY, T0, &id) == SF_OK);
    return id;
}

TEST_CASE("sf_init initializes library", "[c_api]") {
    REQUIRE(sf_init() == SF_OK);
    REQUIRE(sf_init() == SF_OK);
}

TEST_CASE("Config from/to env string", "[c_api]") {
    REQUIRE(sf_init() == SF_OK);

    SECTION("Round trip config") {
        sf_config_t* cfg = nullptr;
        REQUIRE(sf_config_from_env_string("REVEAL_TIMEOUT=120\nMAX_RETRIES=4\n", &cfg) == SF_OK);

        char* output = nullptr;
        REQUIRE(sf_config_to_env_string(cfg, &output) == SF_OK);
        REQUIRE(std::string(output).find("REVEAL_TIMEOUT=120") != std::string::npos);
        REQUIRE(std::string(output).find("MAX_RETRIES=4") != std::string::npos);

        sf_config_t* cfg2 = nullptr;
        REQUIRE(sf_config_from_env_string(output, &cfg2) == SF_OK);

        sf_free_string(output);
        sf_config_destroy(cfg);
        sf_config_destroy(cfg2);
    }

    SECTION("Invalid env string returns validation error") {
        sf_config_t* cfg = nullptr;
        REQUIRE(sf_config_from_env_string("NOT_A_KEY=1", &cfg) == SF_ERR_VALIDATION);
        REQUIRE(cfg == nullptr);
        REQUIRE(sf_config_from_env_string("MAX_RETRIES=0", &cfg) == SF_ERR_VALIDATION);
    }

    SECTION("Null arguments") {
        sf_config_t* cfg = nullptr;
        REQUIRE(sf_config_from_env_string(nullptr, &cfg) == SF_ERR_INVALID_ARG);
        REQUIRE(sf_config_default(nullptr) == SF_ERR_INVALID_ARG);
        REQUIRE(sf_platform_create(nullptr, nullptr, 32, nullptr) == SF_ERR_INVALID_ARG);
    }
}

TEST_CASE("Status names", "[c_api]") {
    REQUIRE(std::strcmp(sf_status_name(SF_STATUS_ACTIVE), "Active") == 0);
    REQUIRE(std::strcmp(sf_status_name(SF_STATUS_DECRYPTION_FAILED), "DecryptionFailed") == 0);
    REQUIRE(std::strcmp(sf_status_name(42), "Unknown") == 0);
}

TEST_CASE("Totals beyond 32 bits reveal through a wider oracle", "[c_api]") {
    REQUIRE(sf_init() == SF_OK);
    sf_platform_t* p = nullptr;
    REQUIRE(sf_platform_create("owner", nullptr, 40, &p) == SF_OK);
    REQUIRE(sf_platform_create("owner", nullptr, 64, &p) == SF_ERR_INVALID_ARG);

    uint64_t id = make_campaign(p, 1000);
    const uint64_t deadline = T0 + 30 * DAY;
    const uint64_t big = (uint64_t(1) << 36) + 5;
    REQUIRE(sf_contribute(p, id, "bob", big, nullptr, T0 + 1) == SF_OK);

    uint64_t rid = 0;
    REQUIRE(sf_finalize(p, id, "alice", deadline, &rid) == SF_OK);
    REQUIRE(sf_oracle_fulfill(p, rid, deadline + 1) == SF_OK);

    uint64_t raised = 0, target = 0;
    REQUIRE(sf_campaign_revealed(p, id, &raised, &target) == SF_OK);
    REQUIRE(raised == big);
    REQUIRE(target == 1000);

    sf_platform_destroy(p);
}

TEST_CASE("Successful campaign through the C API", "[c_api]") {
    REQUIRE(sf_init() == SF_OK);
    sf_platform_t* p = make_platform();
    uint64_t id = make_campaign(p, 1000);
    const uint64_t deadline = T0 + 30 * DAY;

    REQUIRE(sf_contribute(p, id, "bob", 400, "for the bench", T0 + 1) == SF_OK);
    REQUIRE(sf_contribute(p, id, "carol", 400, nullptr, T0 + 2) == SF_OK);
    REQUIRE(sf_contribute(p, id, "dave", 300, nullptr, T0 + 3) == SF_OK);
    REQUIRE(sf_contribute(p, id, "erin", 10, nullptr, deadline) == SF_ERR_STATE);
    REQUIRE(sf_contribute(p, id, "erin", 0, nullptr, T0 + 4) == SF_ERR_VALIDATION);

    uint64_t rid = 0;
    REQUIRE(sf_finalize(p, id, "mallory", deadline, &rid) == SF_ERR_AUTH);
    REQUIRE(sf_finalize(p, id, "alice", deadline, &rid) == SF_OK);

    size_t pending = 0;
    REQUIRE(sf_oracle_pending_count(p, &pending) == SF_OK);
    REQUIRE(pending == 1);

    REQUIRE(sf_oracle_fulfill(p, rid, deadline + 1) == SF_OK);

    int status = -1;
    REQUIRE(sf_campaign_status(p, id, &status) == SF_OK);
    REQUIRE(status == SF_STATUS_SUCCESSFUL);

    uint64_t raised = 0, target = 0;
    REQUIRE(sf_campaign_revealed(p, id, &raised, &target) == SF_OK);
    REQUIRE(raised == 1100);
    REQUIRE(target == 1000);

    uint64_t paid = 0;
    REQUIRE(sf_withdraw(p, id, "bob", deadline + 2, &paid) == SF_ERR_AUTH);
    REQUIRE(sf_withdraw(p, id, "alice", deadline + 2, &paid) == SF_OK);
    REQUIRE(paid == 1100);
    REQUIRE(sf_withdraw(p, id, "alice", deadline + 3, &paid) == SF_ERR_STATE);

    size_t count = 0;
    REQUIRE(sf_payout_count(p, &count) == SF_OK);
    REQUIRE(count == 1);
    char* who = nullptr;
    uint64_t amount = 0;
    REQUIRE(sf_payout_get(p, 0, &who, &amount) == SF_OK);
    REQUIRE(std::string(who) == "alice");
    REQUIRE(amount == 1100);
    sf_free_string(who);
    REQUIRE(sf_payout_get(p, 1, &who, &amount) == SF_ERR_INVALID_ARG);

    sf_stats_t stats;
    REQUIRE(sf_platform_stats(p, &stats) == SF_OK);
    REQUIRE(stats.total == 1);
    REQUIRE(stats.withdrawn == 1);
    REQUIRE(stats.held_balance == 0);

    unsigned char* audit = nullptr;
    size_t audit_len = 0;
    REQUIRE(sf_audit_export(p, &audit, &audit_len) == SF_OK);
    REQUIRE(audit_len > 0);
    sf_free_bytes(audit);

    sf_platform_destroy(p);
}

TEST_CASE("Refunds and timeouts through the C API", "[c_api]") {
    REQUIRE(sf_init() == SF_OK);
    sf_platform_t* p = make_platform();
    const uint64_t deadline = T0 + 30 * DAY;

    SECTION("failed campaign refund") {
        uint64_t id = make_campaign(p, 1000);
        REQUIRE(sf_contribute(p, id, "bob", 300, nullptr, T0 + 1) == SF_OK);

        uint64_t rid = 0;
        REQUIRE(sf_finalize(p, id, "alice", deadline, &rid) == SF_OK);
        REQUIRE(sf_oracle_fulfill(p, rid, deadline + 1) == SF_OK);

        uint64_t raised = 0, target = 0;
        REQUIRE(sf_campaign_revealed(p, id, &raised, &target) == SF_OK);
        REQUIRE(raised == 300);

        uint64_t refund_id = 0;
        REQUIRE(sf_request_refund(p, id, "bob", deadline + 2, &refund_id) == SF_OK);
        REQUIRE(refund_id != 0);

        REQUIRE(sf_set_transfer_failure(p, 1) == SF_OK);
        REQUIRE(sf_oracle_fulfill(p, refund_id, deadline + 3) == SF_ERR_RESOURCE);
        REQUIRE(sf_set_transfer_failure(p, 0) == SF_OK);

        // The oracle answered once; ask again through a replacement request
        uint64_t retry_id = 0;
        REQUIRE(sf_retry_refund_reveal(p, id, "bob", deadline + 2 + 3600, &retry_id) == SF_OK);
        REQUIRE(sf_oracle_fulfill(p, retry_id, deadline + 3 + 3600) == SF_OK);

        char* who = nullptr;
        uint64_t amount = 0;
        REQUIRE(sf_payout_get(p, 0, &who, &amount) == SF_OK);
        REQUIRE(std::string(who) == "bob");
        REQUIRE(amount == 300);
        sf_free_string(who);

        REQUIRE(sf_request_refund(p, id, "bob", deadline + 4 + 3600, &refund_id) == SF_ERR_STATE);
    }

    SECTION("stalled oracle and emergency refund") {
        uint64_t id = make_campaign(p, 1000);
        REQUIRE(sf_contribute(p, id, "bob", 300, nullptr, T0 + 1) == SF_OK);
        REQUIRE(sf_contribute(p, id, "carol", 100, nullptr, T0 + 2) == SF_OK);

        uint64_t rid = 0;
        REQUIRE(sf_finalize(p, id, "alice", deadline, &rid) == SF_OK);
        REQUIRE(sf_oracle_drop(p, rid) == SF_OK);
        REQUIRE(sf_oracle_drop(p, rid) == SF_ERR_INVALID_ARG);

        int outcome = -1;
        uint64_t now = deadline;
        REQUIRE(sf_timeout_check(p, id, "anyone", now + 10, &outcome) == SF_ERR_STATE);
        now += 3600;
        REQUIRE(sf_timeout_check(p, id, "anyone", now, &outcome) == SF_OK);
        REQUIRE(outcome == SF_TIMEOUT_RETRIED);
        now += 3600;
        REQUIRE(sf_timeout_check(p, id, "anyone", now, &outcome) == SF_OK);
        REQUIRE(outcome == SF_TIMEOUT_RETRIED);
        const uint64_t last = now;
        now += 3600;
        REQUIRE(sf_timeout_check(p, id, "anyone", now, &outcome) == SF_OK);
        REQUIRE(outcome == SF_TIMEOUT_FAILED);

        int status = -1;
        REQUIRE(sf_campaign_status(p, id, &status) == SF_OK);
        REQUIRE(status == SF_STATUS_DECRYPTION_FAILED);

        uint64_t paid = 0;
        REQUIRE(sf_emergency_refund(p, id, "bob", last + 2 * 3600 - 1, &paid) == SF_ERR_STATE);
        REQUIRE(sf_emergency_refund(p, id, "bob", last + 2 * 3600, &paid) == SF_OK);
        REQUIRE(paid == 200);
        REQUIRE(sf_emergency_refund(p, id, "carol", last + 2 * 3600, &paid) == SF_OK);
        REQUIRE(paid == 200);

        uint64_t held = 1;
        REQUIRE(sf_campaign_held(p, id, &held) == SF_OK);
        REQUIRE(held == 0);
    }

    SECTION("owner pause") {
        uint64_t id = make_campaign(p, 1000);
        REQUIRE(sf_pause(p, id, "alice", T0 + 1) == SF_ERR_AUTH);
        REQUIRE(sf_pause(p, id, "owner", T0 + 1) == SF_OK);
        REQUIRE(sf_contribute(p, id, "bob", 5, nullptr, T0 + 2) == SF_ERR_STATE);
        REQUIRE(sf_resume(p, id, "owner", T0 + 3) == SF_OK);
        REQUIRE(sf_contribute(p, id, "bob", 5, nullptr, T0 + 4) == SF_OK);
    }

    SECTION("unknown campaign and request") {
        int status = 0;
        REQUIRE(sf_campaign_status(p, 77, &status) == SF_ERR_VALIDATION);
        REQUIRE(sf_oracle_fulfill(p, 77, T0) == SF_ERR_INVALID_ARG);
    }

    sf_platform_destroy(p);
}
