#ifndef MINICHAIN_CHAIN_ERRORS_H
#define MINICHAIN_CHAIN_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace minichain
{

// base of every error raised by the ledger core
class ChainError : public std::runtime_error
{
public:
    explicit ChainError(const std::string &what) : std::runtime_error(what) {}
};

// signing key does not belong to the transaction's sender
class InvalidSignerError : public ChainError
{
public:
    explicit InvalidSignerError(const std::string &what) : ChainError(what) {}
};

class MissingSignatureError : public ChainError
{
public:
    MissingSignatureError() : ChainError("Missing signature") {}
};

class InvalidSignatureError : public ChainError
{
public:
    explicit InvalidSignatureError(const std::string &what = "Signature does not verify") : ChainError(what) {}
};

// negative, non-finite, or (for a transfer) non-positive amount
class InvalidAmountError : public ChainError
{
public:
    explicit InvalidAmountError(const std::string &what) : ChainError(what) {}
};

class InvalidTransactionError : public ChainError
{
public:
    static constexpr std::size_t NO_INDEX = static_cast<std::size_t>(-1);

    explicit InvalidTransactionError(const std::string &what, std::size_t index = NO_INDEX)
        : ChainError(index == NO_INDEX ? what : what + " (transaction #" + std::to_string(index) + ")"),
          txIndex(index) {}

    // position of the offending transaction inside its block, NO_INDEX if not applicable
    std::size_t index() const { return txIndex; }

private:
    std::size_t txIndex;
};

// block's previousHash does not match the hash of the block before it
class ChainLinkageError : public ChainError
{
public:
    explicit ChainLinkageError(std::size_t index)
        : ChainError("Chain linkage broken at block #" + std::to_string(index)), blockIndex(index) {}

    std::size_t index() const { return blockIndex; }

private:
    std::size_t blockIndex;
};

// recomputed block hash differs from the hash stored when it was mined
class BlockTamperError : public ChainError
{
public:
    explicit BlockTamperError(std::size_t index)
        : ChainError("Data tampering detected in block #" + std::to_string(index)), blockIndex(index) {}

    std::size_t index() const { return blockIndex; }

private:
    std::size_t blockIndex;
};

class InvalidDifficultyError : public ChainError
{
public:
    explicit InvalidDifficultyError(long long difficulty)
        : ChainError("Invalid difficulty: " + std::to_string(difficulty) + " (expected 1..64)") {}
    explicit InvalidDifficultyError(const std::string &what) : ChainError(what) {}
};

class EmptyChainError : public ChainError
{
public:
    EmptyChainError() : ChainError("Chain has no genesis block") {}
};

class ConfigError : public ChainError
{
public:
    explicit ConfigError(const std::string &what) : ChainError(what) {}
};

// an OpenSSL call failed; message carries the drained error queue
class CryptoError : public ChainError
{
public:
    explicit CryptoError(const std::string &what) : ChainError(what) {}
};

} // namespace minichain

#endif // MINICHAIN_CHAIN_ERRORS_H
