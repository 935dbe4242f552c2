#pragma once

/**
 * @file LibvirtConnection.hpp
 * @brief libvirt implementation of HypervisorConnection.
 *
 * Wraps a virConnectPtr opened with virConnectOpen(). Domain handles obtained
 * during an operation are freed before the operation returns.
 */

#include "HypervisorConnection.hpp"
#include <libvirt/libvirt.h>
#include <memory>
#include <string>
#include <vector>

namespace kvmrpc {

/**
 * @class LibvirtConnection
 * @brief One libvirt session to the management daemon.
 *
 * Thread Safety:
 * - A connection is used by one pool lease at a time.
 */
class LibvirtConnection : public HypervisorConnection {
public:
    /**
     * @brief Take ownership of an open libvirt connection.
     * @param conn Handle returned by virConnectOpen (must not be null).
     * @param uri URI the handle was opened against.
     */
    LibvirtConnection(virConnectPtr conn, std::string uri);

    /**
     * @brief Destructor - closes the connection if still open.
     */
    ~LibvirtConnection() override;

    const std::string& uri() const override { return m_uri; }

    /**
     * @brief Liveness probe using virConnectGetVersion (a daemon round-trip).
     */
    bool ping() override;

    /**
     * @brief Enumerate all domains, active and inactive.
     * @throws HypervisorException if the enumeration itself fails.
     *
     * A domain whose details cannot be read is logged and skipped.
     */
    std::vector<DomainInfo> listAllDomains() override;

    DomainInfo lookupByName(const std::string& name) override;
    std::string xmlDesc(const std::string& name) override;

    /**
     * @brief Interface addresses from the DHCP leases of the domain's networks.
     * @throws HypervisorException if the domain is unknown or not running.
     */
    std::vector<InterfaceAddress> interfaceAddresses(const std::string& name) override;

    void create(const std::string& name) override;
    void shutdown(const std::string& name) override;
    void destroy(const std::string& name) override;
    void reboot(const std::string& name) override;

    std::string defineXML(const std::string& xml) override;

    void close() override;

private:
    struct DomainDeleter {
        void operator()(virDomainPtr domain) const;
    };
    using DomainHandle = std::unique_ptr<virDomain, DomainDeleter>;

    // Look up a domain or throw HypervisorException
    DomainHandle lookup(const std::string& name);

    // Read name, state, identity, memory and vcpus of a domain
    static DomainInfo readInfo(virDomainPtr domain);

    // Throw HypervisorException if a libvirt call returned < 0
    static void check(int result, const std::string& action, const std::string& name);

    void ensureOpen() const;

    virConnectPtr m_conn;  ///< libvirt connection handle
    std::string m_uri;     ///< Transport URI
};

/**
 * @class LibvirtConnectionFactory
 * @brief Opens LibvirtConnection instances with virConnectOpen().
 *
 * The first factory initializes libvirt and routes libvirt's error
 * printing to the default spdlog logger.
 */
class LibvirtConnectionFactory : public ConnectionFactory {
public:
    LibvirtConnectionFactory();

    /**
     * @brief Open a connection.
     * @throws ConnectionError carrying libvirt's message when the daemon is unreachable.
     */
    std::unique_ptr<HypervisorConnection> open(const std::string& uri) override;
};

}  // namespace kvmrpc
