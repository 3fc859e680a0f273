#include "Crypto.h"
#include "../errors/ChainErrors.h"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/pem.h>
#include <openssl/sha.h>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace minichain
{
namespace crypto
{

const char CURVE_NAME[] = "secp256k1";

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;

static const std::size_t COMPRESSED_KEY_SIZE = 33;
static const std::size_t UNCOMPRESSED_KEY_SIZE = 65;

// Drain the OpenSSL error queue into one line, so the failure can travel in an exception
static std::string drain_openssl_errors()
{
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()))
    {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty())
            out += "; ";
        out += buf;
    }
    return out;
}

[[noreturn]] static void throw_openssl(const std::string &what)
{
    std::string detail = drain_openssl_errors();
    std::cerr << "OpenSSL error: " << what << (detail.empty() ? "" : ": " + detail) << std::endl;
    throw CryptoError(detail.empty() ? what : what + ": " + detail);
}

static std::string bio_to_string(BIO *bio)
{
    BUF_MEM *mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (!mem || !mem->data)
        return "";
    return std::string(mem->data, mem->length);
}

static PkeyPtr load_private_key(const std::string &privateKeyPem)
{
    BioPtr bio(BIO_new_mem_buf(privateKeyPem.data(), (int)privateKeyPem.size()), BIO_free_all);
    if (!bio)
        throw_openssl("BIO_new_mem_buf failed");

    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!pkey)
        throw_openssl("Cannot parse private key PEM");

    char group[64] = {0};
    size_t groupLen = 0;
    if (!EVP_PKEY_is_a(pkey.get(), "EC") ||
        EVP_PKEY_get_utf8_string_param(pkey.get(), OSSL_PKEY_PARAM_GROUP_NAME, group, sizeof(group), &groupLen) != 1 ||
        std::strcmp(group, CURVE_NAME) != 0)
    {
        ERR_clear_error();
        throw CryptoError(std::string("Private key is not a ") + CURVE_NAME + " key");
    }
    return pkey;
}

// Compressed SEC1 encoding of the public half of pkey
static std::vector<unsigned char> compressed_public_key(EVP_PKEY *pkey)
{
    size_t len = 0;
    if (EVP_PKEY_get_octet_string_param(pkey, OSSL_PKEY_PARAM_PUB_KEY, nullptr, 0, &len) != 1)
        throw_openssl("Cannot read public key size");

    std::vector<unsigned char> point(len);
    if (EVP_PKEY_get_octet_string_param(pkey, OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size(), &len) != 1)
        throw_openssl("Cannot read public key");
    point.resize(len);

    if (point.size() == COMPRESSED_KEY_SIZE)
        return point;

    if (point.size() != UNCOMPRESSED_KEY_SIZE || point[0] != 0x04)
        throw CryptoError("Unexpected public key encoding");

    // 0x04 || X || Y  ->  (0x02 | parity(Y)) || X
    std::vector<unsigned char> compressed(point.begin(), point.begin() + COMPRESSED_KEY_SIZE);
    compressed[0] = (point.back() & 1) ? 0x03 : 0x02;
    return compressed;
}

// Rebuild a verification key from an address; null when the address is not a curve point
static PkeyPtr public_key_from_address(const std::string &address)
{
    std::vector<unsigned char> point = fromHex(address);
    if (point.size() != COMPRESSED_KEY_SIZE || (point[0] != 0x02 && point[0] != 0x03))
        return PkeyPtr(nullptr, EVP_PKEY_free);

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free);
    if (!ctx)
        throw_openssl("EVP_PKEY_CTX_new_from_name failed");
    if (EVP_PKEY_fromdata_init(ctx.get()) != 1)
        throw_openssl("EVP_PKEY_fromdata_init failed");

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char *>(CURVE_NAME), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()),
        OSSL_PARAM_construct_end()};

    EVP_PKEY *raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) != 1)
    {
        // not on the curve; a bad address, not an internal failure
        ERR_clear_error();
        return PkeyPtr(nullptr, EVP_PKEY_free);
    }
    return PkeyPtr(raw, EVP_PKEY_free);
}

KeyPair generateKeyPair()
{
    PkeyPtr pkey(EVP_EC_gen(CURVE_NAME), EVP_PKEY_free);
    if (!pkey)
        throw_openssl("EC key generation failed");

    BioPtr bio(BIO_new(BIO_s_mem()), BIO_free_all);
    if (!bio)
        throw_openssl("BIO_new failed");
    if (PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
        throw_openssl("PEM_write_bio_PrivateKey failed");

    KeyPair pair;
    pair.privateKeyPem = bio_to_string(bio.get());
    pair.address = toHex(compressed_public_key(pkey.get()));
    return pair;
}

std::string addressFromPrivateKeyPem(const std::string &privateKeyPem)
{
    PkeyPtr pkey = load_private_key(privateKeyPem);
    return toHex(compressed_public_key(pkey.get()));
}

std::vector<unsigned char> signMessage(const std::string &privateKeyPem, const std::string &message)
{
    PkeyPtr pkey = load_private_key(privateKeyPem);

    MdCtxPtr mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw_openssl("EVP_MD_CTX_new failed");
    if (EVP_DigestSignInit(mdctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1)
        throw_openssl("EVP_DigestSignInit failed");

    size_t sigLen = 0;
    if (EVP_DigestSign(mdctx.get(), nullptr, &sigLen, (const unsigned char *)message.data(), message.size()) != 1)
        throw_openssl("EVP_DigestSign (size) failed");

    std::vector<unsigned char> sig(sigLen);
    if (EVP_DigestSign(mdctx.get(), sig.data(), &sigLen, (const unsigned char *)message.data(), message.size()) != 1)
        throw_openssl("EVP_DigestSign failed");
    sig.resize(sigLen); // DER length varies with the leading bytes of r and s
    return sig;
}

bool verifySignature(const std::string &address,
                     const std::string &message,
                     const std::vector<unsigned char> &derSignature)
{
    if (derSignature.empty())
        return false;

    PkeyPtr pkey = public_key_from_address(address);
    if (!pkey)
        return false;

    MdCtxPtr mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw_openssl("EVP_MD_CTX_new failed");
    if (EVP_DigestVerifyInit(mdctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1)
        throw_openssl("EVP_DigestVerifyInit failed");

    int v = EVP_DigestVerify(mdctx.get(), derSignature.data(), derSignature.size(),
                             (const unsigned char *)message.data(), message.size());
    if (v != 1)
    {
        // 0 is a mismatch, negative is a malformed DER blob; both mean "does not verify"
        ERR_clear_error();
        return false;
    }
    return true;
}

std::string sha256Hex(const std::string &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char *)data.data(), data.size(), hash);
    return toHex(std::vector<unsigned char>(hash, hash + SHA256_DIGEST_LENGTH));
}

std::string toHex(const std::vector<unsigned char> &bytes)
{
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char b : bytes)
        ss << std::setw(2) << (int)b;
    return ss.str();
}

static int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    c = (char)std::tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::vector<unsigned char> fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0)
        return {};

    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return {};
        out.push_back((unsigned char)((hi << 4) | lo));
    }
    return out;
}

std::string base64Encode(const std::vector<unsigned char> &bytes)
{
    if (bytes.empty())
        return "";

    BIO *b64 = BIO_new(BIO_f_base64());
    BIO *mem = BIO_new(BIO_s_mem());
    if (!b64 || !mem)
    {
        BIO_free(b64);
        BIO_free(mem);
        throw_openssl("BIO_new failed");
    }
    BioPtr bio(BIO_push(b64, mem), BIO_free_all);
    BIO_set_flags(bio.get(), BIO_FLAGS_BASE64_NO_NL);

    if (BIO_write(bio.get(), bytes.data(), (int)bytes.size()) != (int)bytes.size() || BIO_flush(bio.get()) != 1)
        throw_openssl("base64 encode failed");

    return bio_to_string(mem);
}

std::vector<unsigned char> base64Decode(const std::string &b64)
{
    if (b64.empty())
        return {};

    BIO *dec = BIO_new(BIO_f_base64());
    BIO *src = BIO_new_mem_buf(b64.data(), (int)b64.size());
    if (!dec || !src)
    {
        BIO_free(dec);
        BIO_free(src);
        throw_openssl("BIO_new failed");
    }
    BioPtr bio(BIO_push(dec, src), BIO_free_all);
    BIO_set_flags(bio.get(), BIO_FLAGS_BASE64_NO_NL);

    // decoded output is never longer than the input
    std::vector<unsigned char> out(b64.size());
    int decoded = BIO_read(bio.get(), out.data(), (int)out.size());
    if (decoded <= 0)
        return {};
    out.resize(decoded);
    return out;
}

} // namespace crypto
} // namespace minichain
