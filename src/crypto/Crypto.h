#ifndef MINICHAIN_CRYPTO_H
#define MINICHAIN_CRYPTO_H

#include <string>
#include <vector>

namespace minichain
{
namespace crypto
{

// every key, address and signature in the ledger lives on this curve
extern const char CURVE_NAME[];

struct KeyPair
{
    std::string privateKeyPem; // PKCS#8 PEM
    std::string address;       // hex of the 33-byte compressed public key
};

// Fresh secp256k1 key pair. Throws CryptoError if OpenSSL fails.
KeyPair generateKeyPair();

// Address (compressed public key, lowercase hex) belonging to a PEM private key.
// Throws CryptoError if the PEM cannot be parsed or is not a secp256k1 key.
std::string addressFromPrivateKeyPem(const std::string &privateKeyPem);

// ECDSA over SHA-256(message); returns the DER-encoded signature.
std::vector<unsigned char> signMessage(const std::string &privateKeyPem, const std::string &message);

// True iff derSignature is a valid ECDSA/SHA-256 signature of message by the key
// encoded in address. A malformed address or signature verifies as false.
bool verifySignature(const std::string &address,
                     const std::string &message,
                     const std::vector<unsigned char> &derSignature);

// sha256 hex (lowercase, 64 chars) of a string
std::string sha256Hex(const std::string &data);

std::string toHex(const std::vector<unsigned char> &bytes);

// Empty result for odd length or non-hex input.
std::vector<unsigned char> fromHex(const std::string &hex);

std::string base64Encode(const std::vector<unsigned char> &bytes);
std::vector<unsigned char> base64Decode(const std::string &b64);

} // namespace crypto
} // namespace minichain

#endif // MINICHAIN_CRYPTO_H
