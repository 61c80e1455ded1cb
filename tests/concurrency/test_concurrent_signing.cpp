#include <catch2/catch_test_macros.hpp>
#include "keystr/signer/signer_engine.hpp"
#include "keystr/vault/key_vault.hpp"
#include "keystr/vault/vault_storage.hpp"
#include "keystr/crypto/secp256k1.hpp"
#include "keystr/crypto/sodium_interop.hpp"
#include "helpers/recording_transport.hpp"
#include "helpers/signer_peer.hpp"
#include <atomic>
#include <memory>
#include <span>
#include <set>
#include <string>
#include <thread>
#include <vector>
using namespace keystr;
using namespace keystr::signer;
using namespace keystr::test_helpers;
using keystr::configuration::SignerConfig;
using keystr::configuration::VaultConfig;
using json = nlohmann::json;
namespace {
std::unique_ptr<KeyVault> FreshVault() {
    auto vault = KeyVault::Create(std::make_shared<MemoryVaultStorage>(), VaultConfig::Default().WithScryptLogN(4)).Unwrap();
    REQUIRE(vault->Generate().IsOk());
    return vault;
}
json Note(int n) {
    return json{{"created_at", 1700000000 + n}, {"kind", 1}, {"tags", json::array()},
                {"content", "note " + std::to_string(n)}};
}
}
TEST_CASE("Concurrency - Shared vault", "[concurrency][vault]") {
    auto vault = FreshVault();
    const auto public_key = *vault->GetPublicKey();
    SECTION("8 threads signing 50 digests each") {
        constexpr int THREAD_COUNT = 8;
        constexpr int SIGNATURES_PER_THREAD = 50;
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < SIGNATURES_PER_THREAD; ++i) {
                    const std::string message = std::to_string(t) + ":" + std::to_string(i);
                    const auto digest = crypto::SodiumInterop::Sha256(
                        std::span(reinterpret_cast<const uint8_t*>(message.data()), message.size()));
                    auto signature = vault->Sign(digest);
                    if (signature.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    auto valid = crypto::Secp256k1::VerifySchnorr(public_key, digest, signature.Unwrap());
                    if (valid.IsErr() || !valid.Unwrap()) {
                        failures.fetch_add(1);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(failures.load() == 0);
    }
    SECTION("Encrypt and decrypt from several threads") {
        SignerPeer peer;
        constexpr int THREAD_COUNT = 6;
        constexpr int MESSAGES_PER_THREAD = 25;
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                    const std::string text = "thread " + std::to_string(t) + " message " + std::to_string(i);
                    auto sealed = vault->Nip04Encrypt(peer.PublicKey(), text);
                    if (sealed.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    auto opened = peer.Vault().Nip04Decrypt(public_key, sealed.Unwrap());
                    if (opened.IsErr() || opened.Unwrap() != text) {
                        failures.fetch_add(1);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(failures.load() == 0);
    }
    SECTION("Lock and unlock race with signing") {
        REQUIRE(vault->Save("race", vault::SecurityLevel::PersistPasswordRequired).IsOk());
        std::atomic<bool> done{false};
        std::atomic<int> unexpected{0};
        std::thread signer([&]() {
            const auto digest = crypto::SodiumInterop::Sha256(std::span<const uint8_t>());
            while (!done.load()) {
                auto signature = vault->Sign(digest);
                if (signature.IsErr() && signature.UnwrapErr().type != FailureType::SigningUnavailable) {
                    unexpected.fetch_add(1);
                }
            }
        });
        for (int i = 0; i < 5; ++i) {
            REQUIRE(vault->Lock().IsOk());
            REQUIRE(vault->Unlock("race").IsOk());
        }
        done.store(true);
        signer.join();
        REQUIRE(unexpected.load() == 0);
        REQUIRE(vault->GetState() == vault::VaultState::LoadedUnlocked);
    }
}
TEST_CASE("Concurrency - Engine under parallel traffic", "[concurrency][engine]") {
    auto vault = FreshVault();
    const auto signer_key = *vault->GetPublicKey();
    auto transport = std::make_shared<RecordingTransport>();
    SECTION("Pre-approved signing from many peers") {
        constexpr int PEER_COUNT = 4;
        constexpr int REQUESTS_PER_PEER = 20;
        auto engine = SignerEngine::Create(*vault, transport, SignerConfig::Default()
            .WithWorkerThreads(4)
            .WithWorkerQueueCapacity(PEER_COUNT * REQUESTS_PER_PEER)
            .WithPreApproved(RequestKind::SignEvent)).Unwrap();
        std::vector<SignerPeer> peers(PEER_COUNT);
        std::vector<std::thread> threads;
        threads.reserve(PEER_COUNT);
        for (int p = 0; p < PEER_COUNT; ++p) {
            threads.emplace_back([&, p]() {
                for (int i = 0; i < REQUESTS_PER_PEER; ++i) {
                    peers[p].Send(*engine, signer_key, std::to_string(i), "sign_event", json::array({Note(i)}));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        engine->WaitIdle();
        REQUIRE(engine->ListSessions().size() == PEER_COUNT);
        REQUIRE(engine->ListPending().empty());

        const auto sent = transport->Drain();
        REQUIRE(sent.size() == PEER_COUNT * REQUESTS_PER_PEER);
        for (const auto& peer : peers) {
            const auto responses = peer.Responses(signer_key, sent);
            REQUIRE(responses.size() == REQUESTS_PER_PEER);
            std::set<std::string> ids;
            for (const auto& response : responses) {
                REQUIRE_FALSE(response.IsError());
                REQUIRE(response.result.get<std::string>().size() == 128);
                ids.insert(response.id);
            }
            REQUIRE(ids.size() == REQUESTS_PER_PEER);
        }
    }
    SECTION("Approvals from one thread while requests arrive on another") {
        constexpr int REQUEST_COUNT = 40;
        auto engine = SignerEngine::Create(*vault, transport, SignerConfig::Default()
            .WithWorkerThreads(2)
            .WithWorkerQueueCapacity(REQUEST_COUNT)).Unwrap();
        SignerPeer client;
        std::atomic<int> approved{0};
        std::atomic<bool> sending_done{false};
        std::thread approver([&]() {
            while (approved.load() < REQUEST_COUNT) {
                for (const auto& view : engine->ListPending()) {
                    if (engine->Decide(view.id, Decision::Approve).IsOk()) {
                        approved.fetch_add(1);
                    }
                }
                if (sending_done.load() && engine->ListPending().empty() && approved.load() < REQUEST_COUNT) {
                    break;
                }
                std::this_thread::yield();
            }
        });
        for (int i = 0; i < REQUEST_COUNT; ++i) {
            client.Send(*engine, signer_key, "req-" + std::to_string(i), "sign_event", json::array({Note(i)}));
        }
        sending_done.store(true);
        approver.join();
        engine->WaitIdle();
        REQUIRE(approved.load() == REQUEST_COUNT);

        const auto responses = client.Responses(signer_key, transport->Drain());
        REQUIRE(responses.size() == REQUEST_COUNT);
        std::set<std::string> ids;
        for (const auto& response : responses) {
            REQUIRE_FALSE(response.IsError());
            ids.insert(response.id);
        }
        REQUIRE(ids.size() == REQUEST_COUNT);
    }
}
