#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace judged {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

const char *judge_exception::error_name() const noexcept {
    return "JudgeClientError";
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

token_verification_failed::token_verification_failed()
    : judge_exception("invalid token") {}

const char *token_verification_failed::error_name() const noexcept {
    return "TokenVerificationFailed";
}

const char *invalid_request::error_name() const noexcept {
    return "InvalidRequest";
}

const char *compilation_error::error_name() const noexcept {
    return "CompileError";
}

const char *spj_compilation_error::error_name() const noexcept {
    return "SPJCompileError";
}

judge_cancelled::judge_cancelled()
    : judge_exception("judge cancelled") {}

}  // namespace judged
