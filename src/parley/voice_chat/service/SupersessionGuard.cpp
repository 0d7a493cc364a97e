#include "parley/voice_chat/service/SupersessionGuard.h"

#include <thread>

namespace parley::voice_chat::service {

SupersessionGuard::SupersessionGuard(const GenerationRegistry& registry,
                                     ResourceClass resourceClass,
                                     OperationToken token,
                                     std::chrono::milliseconds pollInterval)
    : m_registry(registry)
    , m_class(resourceClass)
    , m_token(token)
    , m_pollInterval(pollInterval.count() > 0 ? pollInterval : kDefaultPollInterval)
{}

bool SupersessionGuard::stillCurrent() const {
    return m_registry.isCurrent(m_class, m_token);
}

GuardExit SupersessionGuard::waitWhile(const std::function<bool()>& keepGoing) const {
    for (;;) {
        if (!stillCurrent()) return GuardExit::Superseded;
        if (!keepGoing()) return GuardExit::Finished;
        std::this_thread::sleep_for(m_pollInterval);
    }
}

} // namespace parley::voice_chat::service
