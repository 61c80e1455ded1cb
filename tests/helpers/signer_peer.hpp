#pragma once
#include "keystr/vault/key_vault.hpp"
#include "keystr/vault/vault_storage.hpp"
#include "keystr/signer/message_codec.hpp"
#include "keystr/signer/signer_engine.hpp"
#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "helpers/recording_transport.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace keystr::test_helpers {

using vault::KeyVault;
using vault::MemoryVaultStorage;
using signer::RpcRequest;
using signer::RpcResponse;
using signer::MessageCodec;

/// Remote client of the signer: its own key, NIP-04 through its own vault.
class SignerPeer {
public:
    SignerPeer() {
        auto created = KeyVault::Create(std::make_shared<MemoryVaultStorage>());
        if (created.IsErr() || created.Unwrap()->Generate().IsErr()) {
            throw std::runtime_error("Signer peer: key generation failed");
        }
        vault_ = std::move(created).Unwrap();
    }

    [[nodiscard]] crypto::XOnlyPublicKey PublicKey() const {
        return *vault_->GetPublicKey();
    }

    [[nodiscard]] std::string PublicKeyHex() const {
        return *vault_->GetPublicKeyHex();
    }

    [[nodiscard]] const KeyVault& Vault() const noexcept {
        return *vault_;
    }

    /// Encrypts raw JSON text for @p signer_key.
    [[nodiscard]] std::string Seal(const crypto::XOnlyPublicKey& signer_key, const std::string& text) const {
        auto payload = vault_->Nip04Encrypt(signer_key, text);
        if (payload.IsErr()) {
            throw std::runtime_error("Signer peer: " + payload.UnwrapErr().ToWireError());
        }
        return std::move(payload).Unwrap();
    }

    [[nodiscard]] std::string SealRequest(const crypto::XOnlyPublicKey& signer_key,
                                          const std::string& id,
                                          const std::string& method,
                                          nlohmann::json params = nlohmann::json::array()) const {
        return Seal(signer_key, MessageCodec::EncodeRequest(RpcRequest{id, method, std::move(params)}));
    }

    void Send(signer::SignerEngine& engine,
              const crypto::XOnlyPublicKey& signer_key,
              const std::string& id,
              const std::string& method,
              nlohmann::json params = nlohmann::json::array()) const {
        engine.OnMessage(PublicKey(), SealRequest(signer_key, id, method, std::move(params)));
    }

    /// Decrypted plaintexts of every payload addressed to this peer.
    [[nodiscard]] std::vector<std::string> Open(const crypto::XOnlyPublicKey& signer_key,
                                                const std::vector<SentPayload>& sent) const {
        std::vector<std::string> plaintexts;
        for (const auto& item : sent) {
            if (item.target != PublicKey()) {
                continue;
            }
            auto opened = vault_->Nip04Decrypt(signer_key, item.payload);
            if (opened.IsErr()) {
                throw std::runtime_error("Signer peer: " + opened.UnwrapErr().ToWireError());
            }
            plaintexts.push_back(std::move(opened).Unwrap());
        }
        return plaintexts;
    }

    /// Every response addressed to this peer; requests from the signer are skipped.
    [[nodiscard]] std::vector<RpcResponse> Responses(const crypto::XOnlyPublicKey& signer_key,
                                                     const std::vector<SentPayload>& sent) const {
        std::vector<RpcResponse> responses;
        for (const auto& text : Open(signer_key, sent)) {
            auto envelope = MessageCodec::Parse(text);
            if (envelope.IsErr() || envelope.Unwrap().kind != signer::EnvelopeKind::Response) {
                continue;
            }
            auto response = MessageCodec::DecodeResponse(envelope.Unwrap());
            if (response.IsOk()) {
                responses.push_back(std::move(response).Unwrap());
            }
        }
        return responses;
    }

private:
    std::unique_ptr<KeyVault> vault_;
};

}
