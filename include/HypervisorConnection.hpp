#pragma once

/**
 * @file HypervisorConnection.hpp
 * @brief Backend-neutral interface to a hypervisor management daemon.
 *
 * The connection pool treats a HypervisorConnection as an opaque resource
 * with a liveness probe. The operations layer uses the domain accessors and
 * verbs. The libvirt implementation lives in virt/LibvirtConnection.hpp.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kvmrpc {

enum class DomainState {
    NoState,
    Running,
    Blocked,
    Paused,
    Shutdown,
    Shutoff,
    Crashed,
    Suspended,
    Unknown
};

// Map a raw libvirt state code (virDomainState) to DomainState
DomainState domainStateFromCode(int code);

// "no state", "running", ..., "unknown"
const char* domainStateToString(DomainState state);

struct DomainInfo {
    std::string name;
    int id = -1;  // -1 when the domain is not running
    std::string uuid;
    DomainState state = DomainState::Unknown;
    bool active = false;
    bool persistent = false;
    bool autostart = false;
    uint64_t memoryKiB = 0;
    uint64_t maxMemoryKiB = 0;
    unsigned int vcpus = 0;
};

// One IP address reported for a guest network interface
struct InterfaceAddress {
    enum class Family { IPv4, IPv6 };

    std::string interface;  // guest-visible interface name, e.g. vnet0
    Family family = Family::IPv4;
    std::string address;    // without prefix length
    unsigned int prefix = 0;
};

/**
 * @class HypervisorConnection
 * @brief One open session to the hypervisor daemon.
 *
 * A connection is used by one caller at a time; the pool guarantees that a
 * checked-out connection is never handed to a second caller.
 *
 * Domain-level failures (unknown domain, invalid state) throw
 * HypervisorException.
 */
class HypervisorConnection {
public:
    virtual ~HypervisorConnection() = default;

    HypervisorConnection(const HypervisorConnection&) = delete;
    HypervisorConnection& operator=(const HypervisorConnection&) = delete;

    // Transport URI this connection was opened against
    virtual const std::string& uri() const = 0;

    /**
     * @brief Cheap round-trip used to decide whether the handle is reusable.
     * @return false if the daemon did not answer; never throws.
     */
    virtual bool ping() = 0;

    // Domain enumeration and lookup
    virtual std::vector<DomainInfo> listAllDomains() = 0;
    virtual DomainInfo lookupByName(const std::string& name) = 0;
    virtual std::string xmlDesc(const std::string& name) = 0;

    // Addresses of a running domain's interfaces, in interface order
    virtual std::vector<InterfaceAddress> interfaceAddresses(const std::string& name) = 0;

    // Domain verbs
    virtual void create(const std::string& name) = 0;
    virtual void shutdown(const std::string& name) = 0;
    virtual void destroy(const std::string& name) = 0;
    virtual void reboot(const std::string& name) = 0;

    /**
     * @brief Define a persistent domain from its XML description.
     * @return Name of the defined domain.
     */
    virtual std::string defineXML(const std::string& xml) = 0;

    // Close the session; safe to call more than once
    virtual void close() = 0;

protected:
    HypervisorConnection() = default;
};

/**
 * @class ConnectionFactory
 * @brief Opens new hypervisor connections.
 *
 * open() throws ConnectionError when the daemon cannot be reached.
 */
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    virtual std::unique_ptr<HypervisorConnection> open(const std::string& uri) = 0;
};

}  // namespace kvmrpc
