#pragma once

#include <memory>
#include <set>
#include <string>

// A virtual machine as seen by the backup code.
class Domain {
public:
    virtual ~Domain() = default;

    // Hypervisor-assigned runtime id; -1 for a stopped libvirt domain.
    virtual int getId() const = 0;
    // Stable identity used to deduplicate jobs.
    virtual std::string getUUID() const = 0;
    virtual std::string getName() const = 0;
    virtual std::string getXMLDesc() const = 0;
    virtual bool isActive() const = 0;
};

class HypervisorConnection {
public:
    virtual ~HypervisorConnection() = default;

    // Throws DomainNotFoundError.
    virtual std::shared_ptr<Domain> lookupDomainByName(const std::string& name) = 0;
    virtual std::set<std::string> listAllDomainNames() = 0;
};
