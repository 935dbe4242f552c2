/**
 * @file LibvirtConnection.cpp
 * @brief libvirt-backed hypervisor connection and its factory.
 */

#include "virt/LibvirtConnection.hpp"
#include "ErrorHandler.hpp"
#include <libvirt/virterror.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <mutex>
#include <utility>

namespace kvmrpc {

namespace {

// Replaces libvirt's default handler, which prints every error to stderr
void logLibvirtError(void* /*userData*/, virErrorPtr error) {
    if (error && error->message) {
        spdlog::debug("libvirt: {} (code {})", error->message, error->code);
    }
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

LibvirtConnection::LibvirtConnection(virConnectPtr conn, std::string uri)
    : m_conn(conn), m_uri(std::move(uri)) {
}

LibvirtConnection::~LibvirtConnection() {
    if (m_conn) {
        virConnectClose(m_conn);
        m_conn = nullptr;
    }
}

void LibvirtConnection::DomainDeleter::operator()(virDomainPtr domain) const {
    if (domain) {
        virDomainFree(domain);
    }
}

void LibvirtConnection::close() {
    if (!m_conn) return;

    virConnectPtr conn = m_conn;
    m_conn = nullptr;
    if (virConnectClose(conn) < 0) {
        throw HypervisorException::fromLastError("Failed to close connection to " + m_uri);
    }
}

// ============================================================================
// Liveness
// ============================================================================

bool LibvirtConnection::ping() {
    if (!m_conn) return false;

    unsigned long version = 0;
    return virConnectGetVersion(m_conn, &version) == 0;
}

// ============================================================================
// Domain Queries
// ============================================================================

std::vector<DomainInfo> LibvirtConnection::listAllDomains() {
    ensureOpen();

    virDomainPtr* domains = nullptr;
    int count = virConnectListAllDomains(m_conn, &domains, 0);
    if (count < 0) {
        throw HypervisorException::fromLastError("Failed to list domains");
    }

    // Take ownership of every handle before reading any of them
    std::vector<DomainHandle> handles;
    handles.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        handles.emplace_back(domains[i]);
    }
    std::free(domains);

    std::vector<DomainInfo> result;
    result.reserve(handles.size());
    for (const auto& domain : handles) {
        try {
            result.push_back(readInfo(domain.get()));
        } catch (const HypervisorException& e) {
            const char* name = virDomainGetName(domain.get());
            spdlog::error("Error getting info for domain {}: {}", name ? name : "?", e.what());
        }
    }

    return result;
}

DomainInfo LibvirtConnection::lookupByName(const std::string& name) {
    auto domain = lookup(name);
    return readInfo(domain.get());
}

std::string LibvirtConnection::xmlDesc(const std::string& name) {
    auto domain = lookup(name);

    char* xml = virDomainGetXMLDesc(domain.get(), 0);
    if (!xml) {
        throw HypervisorException::fromLastError("Failed to get XML description of " + name);
    }
    std::string desc(xml);
    std::free(xml);
    return desc;
}

std::vector<InterfaceAddress> LibvirtConnection::interfaceAddresses(const std::string& name) {
    auto domain = lookup(name);

    virDomainInterfacePtr* ifaces = nullptr;
    int count = virDomainInterfaceAddresses(domain.get(), &ifaces,
                                            VIR_DOMAIN_INTERFACE_ADDRESSES_SRC_LEASE, 0);
    if (count < 0) {
        throw HypervisorException::fromLastError("Failed to read interface addresses of " + name);
    }

    std::vector<InterfaceAddress> result;
    for (int i = 0; i < count; ++i) {
        virDomainInterfacePtr iface = ifaces[i];
        for (unsigned int j = 0; j < iface->naddrs; ++j) {
            const virDomainIPAddress& ip = iface->addrs[j];
            if (!ip.addr) {
                continue;
            }
            InterfaceAddress entry;
            entry.interface = iface->name ? iface->name : "";
            entry.family = ip.type == VIR_IP_ADDR_TYPE_IPV6
                ? InterfaceAddress::Family::IPv6
                : InterfaceAddress::Family::IPv4;
            entry.address = ip.addr;
            entry.prefix = ip.prefix;
            result.push_back(std::move(entry));
        }
        virDomainInterfaceFree(iface);
    }
    std::free(ifaces);

    return result;
}

// ============================================================================
// Domain Verbs
// ============================================================================

void LibvirtConnection::create(const std::string& name) {
    auto domain = lookup(name);
    check(virDomainCreate(domain.get()), "start", name);
}

void LibvirtConnection::shutdown(const std::string& name) {
    auto domain = lookup(name);
    check(virDomainShutdown(domain.get()), "shutdown", name);
}

void LibvirtConnection::destroy(const std::string& name) {
    auto domain = lookup(name);
    check(virDomainDestroy(domain.get()), "destroy", name);
}

void LibvirtConnection::reboot(const std::string& name) {
    auto domain = lookup(name);
    check(virDomainReboot(domain.get(), 0), "reboot", name);
}

std::string LibvirtConnection::defineXML(const std::string& xml) {
    ensureOpen();

    DomainHandle domain(virDomainDefineXML(m_conn, xml.c_str()));
    if (!domain) {
        throw HypervisorException::fromLastError("Failed to define domain");
    }

    const char* name = virDomainGetName(domain.get());
    return name ? std::string(name) : std::string();
}

// ============================================================================
// Helpers
// ============================================================================

LibvirtConnection::DomainHandle LibvirtConnection::lookup(const std::string& name) {
    ensureOpen();

    DomainHandle domain(virDomainLookupByName(m_conn, name.c_str()));
    if (!domain) {
        throw HypervisorException::fromLastError("");
    }
    return domain;
}

DomainInfo LibvirtConnection::readInfo(virDomainPtr domain) {
    DomainInfo info;

    const char* name = virDomainGetName(domain);
    if (!name) {
        throw HypervisorException::fromLastError("Failed to read domain name");
    }
    info.name = name;

    unsigned int id = virDomainGetID(domain);
    info.id = (id == static_cast<unsigned int>(-1)) ? -1 : static_cast<int>(id);

    char uuid[VIR_UUID_STRING_BUFLEN];
    if (virDomainGetUUIDString(domain, uuid) == 0) {
        info.uuid = uuid;
    }

    int state = VIR_DOMAIN_NOSTATE;
    int reason = 0;
    check(virDomainGetState(domain, &state, &reason, 0), "read state of", info.name);
    info.state = domainStateFromCode(state);

    int active = virDomainIsActive(domain);
    check(active, "read activity of", info.name);
    info.active = active == 1;

    int persistent = virDomainIsPersistent(domain);
    check(persistent, "read persistence of", info.name);
    info.persistent = persistent == 1;

    int autostart = 0;
    check(virDomainGetAutostart(domain, &autostart), "read autostart of", info.name);
    info.autostart = autostart != 0;

    virDomainInfo raw;
    check(virDomainGetInfo(domain, &raw), "read info of", info.name);
    info.memoryKiB = raw.memory;
    info.maxMemoryKiB = raw.maxMem;
    info.vcpus = raw.nrVirtCpu;

    return info;
}

void LibvirtConnection::check(int result, const std::string& action, const std::string& name) {
    if (result < 0) {
        throw HypervisorException::fromLastError("Failed to " + action + " domain " + name);
    }
}

void LibvirtConnection::ensureOpen() const {
    if (!m_conn) {
        throw ConnectionError("Connection to " + m_uri + " is closed", VIR_ERR_INVALID_CONN);
    }
}

// ============================================================================
// Factory
// ============================================================================

LibvirtConnectionFactory::LibvirtConnectionFactory() {
    static std::once_flag libvirtInitFlag;
    std::call_once(libvirtInitFlag, []() {
        if (virInitialize() < 0) {
            spdlog::error("libvirt initialization failed");
        }
        virSetErrorFunc(nullptr, logLibvirtError);
    });
}

std::unique_ptr<HypervisorConnection> LibvirtConnectionFactory::open(const std::string& uri) {
    virConnectPtr conn = virConnectOpen(uri.c_str());
    if (!conn) {
        throw ConnectionError("Failed to connect to libvirt daemon at " + uri + ": " +
                              ErrorHandler::lastErrorMessage(),
                              ErrorHandler::lastErrorCode());
    }

    return std::make_unique<LibvirtConnection>(conn, uri);
}

}  // namespace kvmrpc
