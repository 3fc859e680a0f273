#ifndef MINICHAIN_TRANSACTION_H
#define MINICHAIN_TRANSACTION_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace minichain
{

// A transfer of `amount` from `sender` to `receiver`. Immutable once built;
// the only state change is attaching the signature.
class Transaction
{
public:
    // sender of mining rewards; such transactions carry no signature
    static const std::string REWARD_SENDER;

    // Throws InvalidAmountError for a negative or non-finite amount.
    Transaction(const std::string &from, const std::string &to, double amt);

    static Transaction reward(const std::string &minerAddress, double amt);

    const std::string &getSender() const { return sender; }
    const std::string &getReceiver() const { return receiver; }
    double getAmount() const { return amount; }
    const std::vector<unsigned char> &getSignature() const { return signature; }

    bool isReward() const { return sender == REWARD_SENDER; }
    bool isSigned() const { return !signature.empty(); }

    // sha256 over the canonical form of (sender, receiver, amount)
    std::string computeHash() const;

    void sign(const std::string &privateKeyPem);

    // Throws MissingSignatureError / InvalidSignatureError; no-op for rewards.
    void checkSignature() const;
    bool isValid() const;

    nlohmann::json toJSON() const;
    static Transaction fromJSON(const nlohmann::json &j);

private:
    std::string sender;
    std::string receiver;
    double amount;
    std::vector<unsigned char> signature; // DER-encoded ECDSA

    nlohmann::json canonicalJSON() const;
};

} // namespace minichain

#endif // MINICHAIN_TRANSACTION_H
