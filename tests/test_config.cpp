#include "test_common.h"
#include "mender/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("MENDER_PROFILE");
    auto p = mender::detect_profile();
    expect_true(p == mender::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("MENDER_PROFILE", "PROD", 1);
    p = mender::detect_profile();
    expect_true(p == mender::Profile::PROD, "should detect PROD case-insensitive");

    // Test 3: Apply defaults (won't override existing)
    setenv("MENDER_TIMEOUT_SEC", "9", 1);
    unsetenv("MENDER_AI_TIMEOUT_MS");
    mender::apply_profile_defaults(mender::Profile::PROD);
    std::string val = std::getenv("MENDER_TIMEOUT_SEC") ? std::getenv("MENDER_TIMEOUT_SEC") : "";
    expect_true(val == "9", "should NOT override pre-existing env var");
    val = std::getenv("MENDER_AI_TIMEOUT_MS") ? std::getenv("MENDER_AI_TIMEOUT_MS") : "";
    expect_true(val == "30000", "PROD should set the AI timeout");
    unsetenv("MENDER_TIMEOUT_SEC");
    unsetenv("MENDER_AI_TIMEOUT_MS");
    unsetenv("MENDER_NETWORK");

    // Test 3b: the default profile keeps untrusted code off the network
    unsetenv("MENDER_PROFILE");
    mender::apply_profile_defaults(mender::detect_profile());
    val = std::getenv("MENDER_NETWORK") ? std::getenv("MENDER_NETWORK") : "";
    expect_true(val == "0", "dev profile sets the network off");
    auto dev = mender::load_repair_config();
    expect_true(dev.profile == mender::Profile::DEV, "dev profile loaded");
    expect_true(!dev.limits.network_enabled, "network disabled by default");
    expect_true(!dev.orchestrator.limits.network_enabled, "orchestrator limits deny network");
    unsetenv("MENDER_NETWORK");
    unsetenv("MENDER_TIMEOUT_SEC");
    unsetenv("MENDER_AI_TIMEOUT_MS");
    setenv("MENDER_PROFILE", "PROD", 1);

    // Test 4: Profile name
    expect_true(std::string(mender::profile_name(mender::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(mender::profile_name(mender::Profile::PROD)) == "prod", "prod name");

    // Test 5: Typed lookups reject junk
    setenv("MENDER_TEST_INT", "12abc", 1);
    expect_eq_ll(mender::getenv_int("MENDER_TEST_INT", 7), 7, "trailing junk falls back");
    setenv("MENDER_TEST_INT", "99999999999999999999", 1);
    expect_eq_ll(mender::getenv_int("MENDER_TEST_INT", 7), 7, "overflow falls back");
    setenv("MENDER_TEST_INT", "-3", 1);
    expect_eq_ll(mender::getenv_int("MENDER_TEST_INT", 7), -3, "negative int");
    expect_eq_ll((long long)mender::getenv_size_t("MENDER_TEST_INT", 5), 5, "negative size rejected");
    setenv("MENDER_TEST_BOOL", "Yes", 1);
    expect_true(mender::getenv_bool("MENDER_TEST_BOOL", false), "yes is true");
    setenv("MENDER_TEST_BOOL", "maybe", 1);
    expect_true(mender::getenv_bool("MENDER_TEST_BOOL", true), "unknown keeps default");

    // Test 6: Full config load
    setenv("MENDER_MEM_BYTES", "67108864", 1);
    setenv("MENDER_CPU_SHARE", "0.5", 1);
    setenv("MENDER_TIMEOUT_SEC", "2.5", 1);
    setenv("MENDER_NETWORK", "1", 1);
    setenv("MENDER_AI_BACKEND", "CMD", 1);
    setenv("MENDER_AI_CMD", "python3 fake_model.py --fast", 1);
    setenv("MENDER_AI_TIMEOUT_MS", "1500", 1);
    setenv("MENDER_MAX_ITERATIONS", "0", 1);
    setenv("MENDER_LOG_DIR", "/tmp/mender-logs", 1);
    setenv("MENDER_PROC_WRAPPER", "firejail --quiet", 1);

    auto c = mender::load_repair_config();
    expect_true(c.profile == mender::Profile::PROD, "profile carried");
    expect_eq_ll((long long)c.limits.memory_bytes, 67108864LL, "memory");
    expect_true(c.limits.cpu_share == 0.5, "cpu share");
    expect_true(c.limits.timeout_seconds == 2.5, "timeout");
    expect_true(c.limits.network_enabled, "network");
    expect_true(c.backend.kind == "cmd", "backend kind lowercased");
    expect_eq_ll(c.backend.timeout_ms, 1500, "ai timeout");
    expect_eq_ll(c.generator.generation_timeout_ms, 1500, "generator uses the ai timeout");
    expect_true(c.orchestrator.limits.timeout_seconds == 2.5, "orchestrator limits");
    expect_true(c.orchestrator.journal_dir == "/tmp/mender-logs", "journal dir");
    expect_eq_ll(c.max_iterations, 1, "iterations clamped to 1");
    expect_eq_ll((long long)c.sandbox.wrapper.size(), 2, "wrapper argv");

    setenv("MENDER_CPU_SHARE", "7", 1);
    setenv("MENDER_TIMEOUT_SEC", "-1", 1);
    c = mender::load_repair_config();
    expect_true(c.limits.cpu_share == 1.0, "out-of-range share reset");
    expect_true(c.limits.timeout_seconds == 5.0, "non-positive timeout reset");

    // Cleanup
    for (const char* k : {"MENDER_PROFILE", "MENDER_AI_TIMEOUT_MS", "MENDER_TEST_INT",
                          "MENDER_TEST_BOOL", "MENDER_MEM_BYTES", "MENDER_CPU_SHARE", "MENDER_TIMEOUT_SEC",
                          "MENDER_NETWORK", "MENDER_AI_BACKEND", "MENDER_AI_CMD", "MENDER_MAX_ITERATIONS",
                          "MENDER_LOG_DIR", "MENDER_PROC_WRAPPER"}) {
        unsetenv(k);
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
