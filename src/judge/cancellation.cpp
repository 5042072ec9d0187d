#include "judge/cancellation.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include "common/exceptions.hpp"

namespace judged {
using namespace std;

static void terminate_process(pid_t pid) {
    if (kill(pid, SIGTERM) < 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to terminate process " << pid << ": " << strerror(errno);
}

void cancellation::register_process(pid_t pid) {
    lock_guard<mutex> guard(mut);
    processes.insert(pid);
    if (is_cancelled) terminate_process(pid);
}

void cancellation::unregister_process(pid_t pid) {
    lock_guard<mutex> guard(mut);
    processes.erase(pid);
}

void cancellation::cancel() {
    lock_guard<mutex> guard(mut);
    is_cancelled = true;
    for (pid_t pid : processes)
        terminate_process(pid);
}

bool cancellation::cancelled() const {
    return is_cancelled;
}

void cancellation::throw_if_cancelled() const {
    if (is_cancelled) throw judge_cancelled();
}

shared_ptr<cancellation> cancellation_registry::create() {
    auto token = make_shared<cancellation>();
    lock_guard<mutex> guard(mut);
    if (shutting_down)
        token->cancel();
    else
        tokens.insert(token);
    return token;
}

void cancellation_registry::remove(const shared_ptr<cancellation> &token) {
    lock_guard<mutex> guard(mut);
    tokens.erase(token);
}

void cancellation_registry::cancel_all() {
    lock_guard<mutex> guard(mut);
    shutting_down = true;
    LOG(INFO) << "Cancelling " << tokens.size() << " running judge(s)";
    for (auto &token : tokens)
        token->cancel();
}

}  // namespace judged
