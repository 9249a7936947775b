#pragma once

#include <string>

namespace reconciliation::settings {

class IJournalClientSettings {
public:
    virtual ~IJournalClientSettings() = default;
    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
};

} // namespace reconciliation::settings
