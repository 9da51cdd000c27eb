#include <atomic>
#include "endpoint_registry.hpp"

EndpointRegistry::EndpointRegistry() : m_map(std::make_shared<const Map>()) {
}

std::shared_ptr<const EndpointRegistry::Map> EndpointRegistry::load() const {
    return std::atomic_load(&m_map);
}

template <typename Fn>
bool EndpointRegistry::update(Fn&& mutate) {
    auto current = load();
    while (true) {
        auto next = std::make_shared<Map>(*current);
        if (!mutate(*next)) {
            return false;
        }
        std::shared_ptr<const Map> published = std::move(next);
        if (std::atomic_compare_exchange_strong(&m_map, &current, published)) {
            return true;
        }
        // current now holds the winner's map; retry against it
    }
}

void EndpointRegistry::insert(const ListenerEndpointPtr& endpoint) {
    update([&](Map& map) {
        map[endpoint->getRegistrationId()] = endpoint;
        return true;
    });
}

bool EndpointRegistry::remove(RegistrationId id) {
    return update([&](Map& map) { return map.erase(id) > 0; });
}

ListenerEndpointPtr EndpointRegistry::find(RegistrationId id) const {
    auto map = load();
    auto it = map->find(id);
    return it != map->end() ? it->second : nullptr;
}

std::vector<ListenerEndpointPtr> EndpointRegistry::snapshot() const {
    auto map = load();
    std::vector<ListenerEndpointPtr> result;
    result.reserve(map->size());
    for (const auto& entry : *map) {
        result.push_back(entry.second);
    }
    return result;
}

std::unordered_set<ListenerEndpointPtr> EndpointRegistry::openEndpoints() {
    std::unordered_set<ListenerEndpointPtr> result;
    std::vector<RegistrationId> stale;
    auto map = load();
    for (const auto& entry : *map) {
        if (!entry.second->isClosed()) {
            result.insert(entry.second);
        } else {
            stale.push_back(entry.first);
        }
    }
    if (!stale.empty()) {
        update([&](Map& map) {
            bool changed = false;
            for (auto id : stale) {
                auto it = map.find(id);
                if (it != map.end() && it->second->isClosed()) {
                    map.erase(it);
                    changed = true;
                }
            }
            return changed;
        });
    }
    return result;
}

size_t EndpointRegistry::size() const {
    return load()->size();
}
