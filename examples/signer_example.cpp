/**
 * @file signer_example.cpp
 * @brief Pairs a client with the signer over an in-process relay and signs one event
 */

#include "keystr/signer/signer_engine.hpp"
#include "keystr/signer/message_codec.hpp"
#include "keystr/vault/key_vault.hpp"
#include "keystr/vault/vault_storage.hpp"

#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

using namespace keystr;
using namespace keystr::signer;
using namespace keystr::vault;

namespace {

/// Stands in for a relay: keeps every payload the signer publishes.
class InProcessRelay : public interfaces::ITransport {
public:
    Result<Unit, KeystrFailure> Send(const crypto::XOnlyPublicKey& target, const std::string& payload) override {
        std::lock_guard<std::mutex> guard(lock_);
        outbox_.emplace_back(target, payload);
        return Result<Unit, KeystrFailure>::Ok(unit);
    }

    std::vector<std::pair<crypto::XOnlyPublicKey, std::string>> Drain() {
        std::lock_guard<std::mutex> guard(lock_);
        return std::exchange(outbox_, {});
    }

private:
    std::mutex lock_;
    std::vector<std::pair<crypto::XOnlyPublicKey, std::string>> outbox_;
};

void PrintReplies(InProcessRelay& relay, const KeyVault& client, const crypto::XOnlyPublicKey& signer) {
    for (const auto& [target, payload] : relay.Drain()) {
        auto plaintext = client.Nip04Decrypt(signer, payload);
        if (plaintext.IsErr()) {
            std::cerr << "   could not decrypt reply: " << plaintext.UnwrapErr().ToWireError() << std::endl;
            continue;
        }
        std::cout << "   <- " << plaintext.Unwrap() << std::endl;
    }
}

bool SendRequest(SignerEngine& engine, const KeyVault& client, const crypto::XOnlyPublicKey& signer,
                 const RpcRequest& request) {
    auto payload = client.Nip04Encrypt(signer, MessageCodec::EncodeRequest(request));
    if (payload.IsErr()) {
        std::cerr << "   could not encrypt request: " << payload.UnwrapErr().ToWireError() << std::endl;
        return false;
    }
    std::cout << "   -> " << request.method << " (" << request.id << ")" << std::endl;
    engine.OnMessage(*client.GetPublicKey(), payload.Unwrap());
    return true;
}

}

int main() {
    std::cout << "=== keystr - remote signer example ===" << std::endl << std::endl;

    auto signer_vault_result = KeyVault::Create(std::make_shared<MemoryVaultStorage>());
    auto client_vault_result = KeyVault::Create(std::make_shared<MemoryVaultStorage>());
    if (signer_vault_result.IsErr() || client_vault_result.IsErr()) {
        std::cerr << "Failed to create vaults" << std::endl;
        return 1;
    }
    auto signer_vault = std::move(signer_vault_result).Unwrap();
    auto client_vault = std::move(client_vault_result).Unwrap();

    std::cout << "1. Generating signer and client identities..." << std::endl;
    if (signer_vault->Generate().IsErr() || client_vault->Generate().IsErr()) {
        std::cerr << "Failed to generate keys" << std::endl;
        return 1;
    }
    const auto signer_key = *signer_vault->GetPublicKey();
    std::cout << "   signer: " << *signer_vault->GetNpub() << std::endl;
    std::cout << "   client: " << *client_vault->GetNpub() << std::endl << std::endl;

    auto relay = std::make_shared<InProcessRelay>();
    auto engine_result = SignerEngine::Create(*signer_vault, relay,
        configuration::SignerConfig::Default().WithWorkerThreads(1));
    if (engine_result.IsErr()) {
        std::cerr << "Failed to start engine: " << engine_result.UnwrapErr().ToWireError() << std::endl;
        return 1;
    }
    auto engine = std::move(engine_result).Unwrap();

    std::cout << "2. Pairing from the client's nostrconnect URI..." << std::endl;
    const std::string uri = "nostrconnect://" + *client_vault->GetPublicKeyHex() +
        "?relay=wss%3A%2F%2Frelay.example.com&metadata=%7B%22name%22%3A%22Example%22%7D";
    auto paired = engine->Connect(uri);
    if (paired.IsErr()) {
        std::cerr << "Pairing failed: " << paired.UnwrapErr().ToWireError() << std::endl;
        return 1;
    }
    std::cout << "   app: " << paired.Unwrap().app_name.value_or("(unnamed)")
              << ", relay: " << paired.Unwrap().relays.front() << std::endl;
    PrintReplies(*relay, *client_vault, signer_key);
    std::cout << std::endl;

    std::cout << "3. Read-only requests are answered at once..." << std::endl;
    SendRequest(*engine, *client_vault, signer_key, RpcRequest{"1", "describe", nlohmann::json::array()});
    SendRequest(*engine, *client_vault, signer_key, RpcRequest{"2", "get_public_key", nlohmann::json::array()});
    PrintReplies(*relay, *client_vault, signer_key);
    std::cout << std::endl;

    std::cout << "4. sign_event waits for approval..." << std::endl;
    const nlohmann::json event = {
        {"created_at", 1700000000},
        {"kind", 1},
        {"tags", nlohmann::json::array()},
        {"content", "hello from keystr"}
    };
    SendRequest(*engine, *client_vault, signer_key, RpcRequest{"3", "sign_event", nlohmann::json::array({event})});
    for (const auto& pending : engine->ListPending()) {
        std::cout << "   pending " << pending.id << ": " << pending.description << std::endl;
    }
    auto decided = engine->Decide("3", Decision::Approve);
    if (decided.IsErr()) {
        std::cerr << "Decision failed: " << decided.UnwrapErr().ToWireError() << std::endl;
        return 1;
    }
    engine->WaitIdle();
    PrintReplies(*relay, *client_vault, signer_key);
    std::cout << std::endl;

    std::cout << "5. Disconnecting..." << std::endl;
    engine->DisconnectAll();
    std::cout << "   sessions left: " << engine->SessionCount() << std::endl;

    std::cout << std::endl << "=== Example completed ===" << std::endl;
    return 0;
}
