#include "Transaction.h"
#include "../crypto/Crypto.h"
#include "../errors/ChainErrors.h"
#include <cmath>

namespace minichain
{

const std::string Transaction::REWARD_SENDER = "SYSTEM";

static void check_amount(double amount)
{
    if (!std::isfinite(amount))
        throw InvalidAmountError("Amount must be a finite number");
    if (amount < 0)
        throw InvalidAmountError("Amount must not be negative: " + std::to_string(amount));
}

Transaction::Transaction(const std::string &from, const std::string &to, double amt)
    : sender(from), receiver(to), amount(amt)
{
    check_amount(amount);
}

Transaction Transaction::reward(const std::string &minerAddress, double amt)
{
    return Transaction(REWARD_SENDER, minerAddress, amt);
}

// nlohmann::json objects keep their keys sorted, so dump() is canonical
nlohmann::json Transaction::canonicalJSON() const
{
    nlohmann::json j;
    j["sender"] = sender;
    j["receiver"] = receiver;
    j["amount"] = amount;
    return j;
}

std::string Transaction::computeHash() const
{
    return crypto::sha256Hex(canonicalJSON().dump());
}

void Transaction::sign(const std::string &privateKeyPem)
{
    if (isReward())
        throw InvalidSignerError("Reward transactions are not signed");
    if (isSigned())
        throw InvalidSignerError("Transaction is already signed");

    std::string signer = crypto::addressFromPrivateKeyPem(privateKeyPem);
    if (signer != sender)
        throw InvalidSignerError("Signing key does not match sender " + sender);

    signature = crypto::signMessage(privateKeyPem, computeHash());
}

void Transaction::checkSignature() const
{
    if (isReward())
        return;

    if (signature.empty())
        throw MissingSignatureError();

    if (!crypto::verifySignature(sender, computeHash(), signature))
        throw InvalidSignatureError("Signature does not verify against sender " + sender);
}

bool Transaction::isValid() const
{
    try
    {
        checkSignature();
        return true;
    }
    catch (const MissingSignatureError &)
    {
        return false;
    }
    catch (const InvalidSignatureError &)
    {
        return false;
    }
}

nlohmann::json Transaction::toJSON() const
{
    nlohmann::json j = canonicalJSON();
    if (!signature.empty())
        j["signature"] = crypto::base64Encode(signature);
    return j;
}

Transaction Transaction::fromJSON(const nlohmann::json &j)
{
    try
    {
        Transaction tx(j.value("sender", std::string()),
                       j.value("receiver", std::string()),
                       j.value("amount", 0.0));
        tx.signature = crypto::base64Decode(j.value("signature", std::string()));
        return tx;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw InvalidTransactionError(std::string("Malformed transaction JSON: ") + e.what());
    }
}

} // namespace minichain
