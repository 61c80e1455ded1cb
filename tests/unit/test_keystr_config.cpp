#include <catch2/catch_test_macros.hpp>
#include "keystr/configuration/keystr_config.hpp"
#include <chrono>
using namespace keystr;
using namespace keystr::configuration;
using keystr::signer::RequestKind;
using keystr::vault::SecurityLevel;
using namespace std::chrono_literals;
TEST_CASE("VaultConfig - Defaults and modifiers", "[config]") {
    SECTION("Default matches earlier releases") {
        constexpr auto config = VaultConfig::Default();
        STATIC_REQUIRE(config.GetScryptLogN() == 13);
        STATIC_REQUIRE(config.GetDefaultSecurityLevel() == SecurityLevel::PersistPasswordRequired);
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Modifiers return adjusted copies") {
        const auto base = VaultConfig::Default();
        const auto tuned = base.WithScryptLogN(15).WithDefaultSecurityLevel(SecurityLevel::NeverPersist);
        REQUIRE(base.GetScryptLogN() == 13);
        REQUIRE(tuned.GetScryptLogN() == 15);
        REQUIRE(tuned.GetDefaultSecurityLevel() == SecurityLevel::NeverPersist);
    }
    SECTION("Work factor bounds") {
        REQUIRE(VaultConfig::Default().WithScryptLogN(0).Validate().IsErr());
        REQUIRE(VaultConfig::Default().WithScryptLogN(1).Validate().IsOk());
        REQUIRE(VaultConfig::Default().WithScryptLogN(22).Validate().IsOk());
        REQUIRE(VaultConfig::Default().WithScryptLogN(23).Validate().IsErr());
    }
}
TEST_CASE("SignerConfig - Defaults and validation", "[config]") {
    SECTION("Defaults") {
        constexpr auto config = SignerConfig::Default();
        STATIC_REQUIRE(config.GetApprovalTimeout() == 120s);
        STATIC_REQUIRE(config.GetWorkerThreads() == 2);
        STATIC_REQUIRE(config.GetWorkerQueueCapacity() == 64);
        STATIC_REQUIRE(config.GetMaxPendingRequests() == 256);
        for (const RequestKind kind : signer::kSupportedKinds) {
            REQUIRE_FALSE(config.IsPreApproved(kind));
        }
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Pre-approved kinds accumulate") {
        const auto config = SignerConfig::Default()
            .WithPreApproved(RequestKind::SignEvent)
            .WithPreApproved(RequestKind::Nip04Encrypt);
        REQUIRE(config.IsPreApproved(RequestKind::SignEvent));
        REQUIRE(config.IsPreApproved(RequestKind::Nip04Encrypt));
        REQUIRE_FALSE(config.IsPreApproved(RequestKind::Nip04Decrypt));
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Zero worker threads is allowed") {
        REQUIRE(SignerConfig::Default().WithWorkerThreads(0).Validate().IsOk());
    }
    SECTION("Invalid values are refused") {
        REQUIRE(SignerConfig::Default().WithApprovalTimeout(0ms).Validate().IsErr());
        REQUIRE(SignerConfig::Default().WithWorkerQueueCapacity(0).Validate().IsErr());
        REQUIRE(SignerConfig::Default().WithMaxPendingRequests(0).Validate().IsErr());
        auto unknown = SignerConfig::Default().WithPreApproved(RequestKind::Unknown).Validate();
        REQUIRE(unknown.IsErr());
        REQUIRE(unknown.UnwrapErr().type == FailureType::InvalidState);
    }
}
TEST_CASE("RequestKind - Method names", "[config][protocol]") {
    for (const RequestKind kind : signer::kSupportedKinds) {
        REQUIRE(signer::ParseMethod(signer::MethodName(kind)) == kind);
    }
    REQUIRE(signer::ParseMethod("foo") == RequestKind::Unknown);
    REQUIRE(signer::ParseMethod("SIGN_EVENT") == RequestKind::Unknown);
    REQUIRE(signer::RequiresApproval(RequestKind::SignEvent));
    REQUIRE(signer::RequiresApproval(RequestKind::Nip04Decrypt));
    REQUIRE_FALSE(signer::RequiresApproval(RequestKind::GetPublicKey));
    REQUIRE_FALSE(signer::RequiresApproval(RequestKind::Unknown));
}
