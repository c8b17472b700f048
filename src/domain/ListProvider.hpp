/**
 * @file ListProvider.hpp
 * @brief Port for the contact-list directory.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/ClientContext.hpp"

namespace campaignflow::domain {

struct ContactList {
    std::string id;
    std::string name;
    std::string displayName;
    long long size = 0;
};

/**
 * @struct ListLookup
 * @brief Lists returned by the directory, or the reason none could be fetched.
 */
struct ListLookup {
    std::vector<ContactList> lists;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

class ListProvider {
public:
    virtual ~ListProvider() = default;

    /** @brief Fetches the smart lists of a location. Never throws for remote failures. */
    virtual ListLookup fetchLists(const std::string& locationId,
                                  const ListApiCredentials& credentials) = 0;
};

} // namespace campaignflow::domain
