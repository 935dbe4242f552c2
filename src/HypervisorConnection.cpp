#include "HypervisorConnection.hpp"
#include <libvirt/libvirt.h>

namespace kvmrpc {

DomainState domainStateFromCode(int code) {
    switch (code) {
        case VIR_DOMAIN_NOSTATE:     return DomainState::NoState;
        case VIR_DOMAIN_RUNNING:     return DomainState::Running;
        case VIR_DOMAIN_BLOCKED:     return DomainState::Blocked;
        case VIR_DOMAIN_PAUSED:      return DomainState::Paused;
        case VIR_DOMAIN_SHUTDOWN:    return DomainState::Shutdown;
        case VIR_DOMAIN_SHUTOFF:     return DomainState::Shutoff;
        case VIR_DOMAIN_CRASHED:     return DomainState::Crashed;
        case VIR_DOMAIN_PMSUSPENDED: return DomainState::Suspended;
        default:                     return DomainState::Unknown;
    }
}

const char* domainStateToString(DomainState state) {
    switch (state) {
        case DomainState::NoState:   return "no state";
        case DomainState::Running:   return "running";
        case DomainState::Blocked:   return "blocked";
        case DomainState::Paused:    return "paused";
        case DomainState::Shutdown:  return "shutdown";
        case DomainState::Shutoff:   return "shutoff";
        case DomainState::Crashed:   return "crashed";
        case DomainState::Suspended: return "suspended";
        case DomainState::Unknown:
        default:                     return "unknown";
    }
}

}  // namespace kvmrpc
