#include "Block.h"
#include "../crypto/Crypto.h"
#include "../errors/ChainErrors.h"
#include <chrono>
#include <iostream>

namespace minichain
{

const std::string Block::GENESIS_PREVIOUS_HASH = "0";

Block::Block(const std::vector<Transaction> &txs, const std::string &prevHash, std::int64_t time)
    : transactions(txs), timestamp(time), previousHash(prevHash), nonce(0)
{
    hash = computeHash();
}

Block::Block(const std::vector<Transaction> &txs, const std::string &prevHash)
    : Block(txs, prevHash, nowMillis())
{
}

std::int64_t Block::nowMillis()
{
    return (std::int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

nlohmann::json Block::transactionsJSON() const
{
    nlohmann::json txs = nlohmann::json::array();
    for (const auto &tx : transactions)
        txs.push_back(tx.toJSON());
    return txs;
}

// canonical block form: sorted keys, transactions in insertion order
std::string Block::hashWith(const nlohmann::json &txs) const
{
    nlohmann::json j;
    j["transactions"] = txs;
    j["timestamp"] = timestamp;
    j["previousHash"] = previousHash;
    j["nonce"] = nonce;
    return crypto::sha256Hex(j.dump());
}

std::string Block::computeHash() const
{
    return hashWith(transactionsJSON());
}

std::string Block::target(int difficulty)
{
    return std::string(difficulty > 0 ? difficulty : 0, '0');
}

void Block::checkDifficulty(int difficulty)
{
    if (difficulty < 1 || difficulty > MAX_DIFFICULTY)
        throw InvalidDifficultyError(difficulty);
}

bool Block::meetsDifficulty(int difficulty) const
{
    return hash.compare(0, difficulty, target(difficulty)) == 0;
}

void Block::mineBlock(int difficulty)
{
    checkDifficulty(difficulty);

    // never stamp work on tampered data
    checkTransactions();

    // the transaction list does not change while searching, serialize it once
    const nlohmann::json txs = transactionsJSON();
    const std::string prefix = target(difficulty);

    hash = hashWith(txs);
    while (hash.compare(0, difficulty, prefix) != 0)
    {
        nonce++;
        hash = hashWith(txs);
    }
}

void Block::checkTransactions() const
{
    for (size_t i = 0; i < transactions.size(); i++)
    {
        try
        {
            transactions[i].checkSignature();
        }
        catch (const MissingSignatureError &e)
        {
            throw InvalidTransactionError(e.what(), i);
        }
        catch (const InvalidSignatureError &e)
        {
            throw InvalidTransactionError(e.what(), i);
        }
    }
}

bool Block::validateTransactions() const
{
    for (const auto &tx : transactions)
    {
        if (!tx.isValid())
            return false;
    }
    return true;
}

nlohmann::json Block::toJSON() const
{
    nlohmann::json j;
    j["timestamp"] = timestamp;
    j["previousHash"] = previousHash;
    j["hash"] = hash;
    j["nonce"] = nonce;
    j["transactions"] = transactionsJSON();
    return j;
}

// keeps the stored hash as-is so that a tampered export is still detectable
Block Block::fromJSON(const nlohmann::json &j)
{
    try
    {
        std::vector<Transaction> txs;
        for (const auto &t : j.at("transactions"))
            txs.push_back(Transaction::fromJSON(t));

        Block b(txs, j.at("previousHash").get<std::string>(), j.at("timestamp").get<std::int64_t>());
        b.nonce = j.value("nonce", (std::uint64_t)0);
        b.hash = j.value("hash", std::string());
        return b;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ChainError(std::string("Malformed block JSON: ") + e.what());
    }
}

} // namespace minichain
