#include <cstdlib>
#include <iostream>
#include <string>
#include "./blockchain/Blockchain.h"
#include "./config/ChainConfig.h"
#include "./crypto/Crypto.h"
#include "./errors/ChainErrors.h"

using namespace minichain;

// usage: minichain_demo [config.json]
int main(int argc, char **argv)
{
    try
    {
        ChainConfig config = argc > 1 ? ChainConfig::loadFromFile(argv[1]) : ChainConfig();
        Blockchain blockchain(config);

        crypto::KeyPair alice = crypto::generateKeyPair();
        crypto::KeyPair bob = crypto::generateKeyPair();
        crypto::KeyPair miner = crypto::generateKeyPair();

        std::cout << "Address 1: " << alice.address << "\n";
        std::cout << "Address 2: " << bob.address << "\n";
        std::cout << "Miner address: " << miner.address << "\n";

        Transaction transfer(alice.address, bob.address, 100);
        transfer.sign(alice.privateKeyPem);
        std::cout << transfer.toJSON().dump() << "\n";

        blockchain.addTransaction(transfer);
        blockchain.minePendingTransactions(miner.address);

        std::cout << "Chain valid: " << (blockchain.isValidChain() ? "true" : "false") << "\n";
        std::cout << "Chain length: " << blockchain.size() << "\n";
        std::cout << "Latest block hash: " << blockchain.getLatestBlock().getHash() << "\n";
        std::cout << "Pending: " << blockchain.getMempool().size() << " transaction(s)\n";

        return blockchain.isValidChain() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const ChainError &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
