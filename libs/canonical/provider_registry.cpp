/**
 * @file provider_registry.cpp
 * @brief Named canonicalization provider registry
 */

#include "linkdiff/collaborators.hpp"

#include <utility>

namespace linkdiff {

void ProviderRegistry::register_provider(std::string name,
                                         std::shared_ptr<const CanonicalizationProvider> provider)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_providers[std::move(name)] = std::move(provider);
}

bool ProviderRegistry::unregister_provider(std::string_view name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_providers.find(name);
    if (it == m_providers.end()) {
        return false;
    }
    m_providers.erase(it);
    return true;
}

std::shared_ptr<const CanonicalizationProvider> ProviderRegistry::find(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_providers.find(name);
    return it == m_providers.end() ? nullptr : it->second;
}

std::vector<std::string> ProviderRegistry::names() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_providers.size());
    for (const auto& [name, provider] : m_providers) {
        result.push_back(name);
    }
    return result;
}

ProviderRegistry& default_registry()
{
    static ProviderRegistry registry;
    return registry;
}

}  // namespace linkdiff
