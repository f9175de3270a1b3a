#include "ext/collaborators.hpp"

#include "util/logger.hpp"

namespace forge {

void LoggingAuditSink::Record(const CallerIdentity& actor,
                              const std::string& action,
                              const std::string& resource,
                              const std::string& details) {
    LogInfo("audit: actor=%s (%s) action=%s resource=%s details=%s",
            actor.id.c_str(), actor.email.c_str(), action.c_str(), resource.c_str(), details.c_str());
}

} // namespace forge
