#pragma once

#include <pugixml.hpp>
#include <optional>
#include <string>

namespace kvmrpc {

/**
 * @brief Builds a libvirt <domain type='kvm'> definition.
 *
 * Usage:
 * @code
 *   std::string xml = DomainXmlBuilder()
 *       .setName("web01")
 *       .setMemoryMiB(2048)
 *       .setVcpus(2)
 *       .setDisk("/vm/web01.qcow2")
 *       .setNetwork("default", "network")
 *       .build();
 * @endcode
 */
class DomainXmlBuilder {
public:
    DomainXmlBuilder() = default;

    // Non-copyable
    DomainXmlBuilder(const DomainXmlBuilder&) = delete;
    DomainXmlBuilder& operator=(const DomainXmlBuilder&) = delete;

    DomainXmlBuilder& setName(const std::string& name);
    DomainXmlBuilder& setMemoryMiB(unsigned long memory);
    DomainXmlBuilder& setVcpus(unsigned int vcpus);
    DomainXmlBuilder& setArchitecture(const std::string& arch);
    DomainXmlBuilder& setDisk(const std::string& diskPath);

    /**
     * @param source Network name, or bridge device when mode is "bridge".
     * @param mode "network" or "bridge".
     */
    DomainXmlBuilder& setNetwork(const std::string& source, const std::string& mode);

    DomainXmlBuilder& setVncListen(const std::string& address);
    DomainXmlBuilder& setEmulator(const std::string& emulator);

    /**
     * @brief Build and return the formatted XML document.
     *
     * The builder can be reused; each call starts from an empty document.
     */
    std::string build();

    /**
     * @brief Read the VNC display port from a domain XML description.
     * @return Port number, or nullopt when no VNC graphics device has an
     *         assigned port (autoport domains report -1 until started).
     */
    static std::optional<int> parseVncPort(const std::string& xml);

private:
    void buildOsSection(pugi::xml_node domain);
    void buildDevicesSection(pugi::xml_node domain);

    pugi::xml_document m_doc;

    std::string m_name;
    unsigned long m_memoryMiB = 1024;
    unsigned int m_vcpus = 1;
    std::string m_arch = "x86_64";
    std::string m_diskPath;
    std::string m_networkSource = "default";
    std::string m_networkMode = "network";
    std::string m_vncListen = "0.0.0.0";
    std::string m_emulator = "/usr/bin/qemu-system-x86_64";
};

}  // namespace kvmrpc
