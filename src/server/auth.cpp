#include "server/auth.hpp"
#include "common/digest.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"

namespace judged {
using namespace std;

string token_digest(const string &token) {
    return sha256_hex(token);
}

void verify_token(const string &provided) {
    if (TOKEN_DIGEST.empty() || !secure_equals(provided, TOKEN_DIGEST))
        throw token_verification_failed();
}

}  // namespace judged
