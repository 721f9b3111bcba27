#pragma once

#include "backup/hypervisor.hpp"
#include <libvirt/libvirt.h>
#include <memory>
#include <mutex>
#include <set>
#include <string>

class LibvirtDomain : public Domain {
public:
    // Takes ownership of dom.
    explicit LibvirtDomain(virDomainPtr dom);
    ~LibvirtDomain() override;

    LibvirtDomain(const LibvirtDomain&) = delete;
    LibvirtDomain& operator=(const LibvirtDomain&) = delete;

    int getId() const override;
    std::string getUUID() const override;
    std::string getName() const override;
    std::string getXMLDesc() const override;
    bool isActive() const override;

    virDomainPtr getRawHandle() const { return dom_; }

private:
    virDomainPtr dom_;
};

class LibvirtConnection : public HypervisorConnection {
public:
    LibvirtConnection();
    ~LibvirtConnection() override;

    LibvirtConnection(const LibvirtConnection&) = delete;
    LibvirtConnection& operator=(const LibvirtConnection&) = delete;

    // Empty username/password uses libvirt's default authentication callbacks.
    bool connect(const std::string& uri,
                 const std::string& username = "",
                 const std::string& password = "");
    void disconnect();
    bool isConnected() const;

    std::shared_ptr<Domain> lookupDomainByName(const std::string& name) override;
    std::set<std::string> listAllDomainNames() override;

    std::string getLastError() const { return lastError_; }

private:
    static int authCallback(virConnectCredentialPtr cred, unsigned int ncred, void* cbdata);

    virConnectPtr conn_;
    std::string uri_;
    std::string username_;
    std::string password_;
    std::string lastError_;
    mutable std::mutex mutex_;
};

// Message of the last libvirt error on this thread.
std::string lastLibvirtError();
