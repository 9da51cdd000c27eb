#pragma once
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "listener_endpoint.hpp"

// Open endpoints keyed by registration id. The map is copy-on-write: readers
// take a snapshot without locking, writers publish a new map with a CAS.
// Closed entries may linger until a reader or the reactor purges them.
class EndpointRegistry {
    using Map = std::unordered_map<RegistrationId, ListenerEndpointPtr>;
    std::shared_ptr<const Map> m_map;

    template <typename Fn>
    bool update(Fn&& mutate);

    std::shared_ptr<const Map> load() const;

public:
    EndpointRegistry();

    void insert(const ListenerEndpointPtr& endpoint);
    bool remove(RegistrationId id);
    ListenerEndpointPtr find(RegistrationId id) const;

    // Every entry, open or not.
    std::vector<ListenerEndpointPtr> snapshot() const;

    // Open entries only; closed ones found along the way are removed.
    std::unordered_set<ListenerEndpointPtr> openEndpoints();

    size_t size() const;
    bool empty() const { return size() == 0; }
};
