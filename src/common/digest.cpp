#include "common/digest.hpp"
#include <fmt/core.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace judged {
using namespace std;

static string digest_hex(const EVP_MD *md, const string &data) {
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1)
        throw runtime_error("unable to compute digest");

    string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
        result += fmt::format("{:02x}", digest[i]);
    return result;
}

string sha256_hex(const string &data) {
    return digest_hex(EVP_sha256(), data);
}

string md5_hex(const string &data) {
    return digest_hex(EVP_md5(), data);
}

bool secure_equals(const string &a, const string &b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace judged
