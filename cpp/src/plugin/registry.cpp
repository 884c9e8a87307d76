// ==============================================================================
// registry.cpp - MOD-0008: Реестр плагинов
// ==============================================================================
//
// MOD-0008 registry
//
// ==============================================================================

#include <sandpipe/registry.hpp>

#include <stdexcept>

namespace sandpipe {

// ============================================================================
// Group
// ============================================================================

const char* to_string(Group group) {
    switch (group) {
    case Group::Auxiliary:
        return "auxiliary";
    case Group::Machinery:
        return "machinery";
    case Group::Processing:
        return "processing";
    case Group::Reporting:
        return "reporting";
    case Group::Signatures:
        return "signatures";
    }
    return "unknown";
}

Group parse_group(std::string_view s) {
    for (Group group : all_groups()) {
        if (s == to_string(group)) {
            return group;
        }
    }
    throw std::invalid_argument("unknown plugin group: " + std::string(s));
}

const std::vector<Group>& all_groups() {
    static const std::vector<Group> groups = {
        Group::Auxiliary, Group::Machinery, Group::Processing, Group::Reporting,
        Group::Signatures,
    };
    return groups;
}

// ============================================================================
// PluginDescriptor
// ============================================================================

std::unique_ptr<Plugin> PluginDescriptor::instantiate() const {
    if (!factory) {
        throw std::runtime_error("plugin '" + name + "' has no factory");
    }
    return factory();
}

// ============================================================================
// Registry
// ============================================================================

void Registry::register_plugin(PluginDescriptor descriptor) {
    groups_[descriptor.group].push_back(std::move(descriptor));
}

const std::vector<PluginDescriptor>& Registry::list(Group group) const {
    static const std::vector<PluginDescriptor> empty;
    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return empty;
    }
    return it->second;
}

std::size_t Registry::size() const {
    std::size_t total = 0;
    for (const auto& [group, descriptors] : groups_) {
        total += descriptors.size();
    }
    return total;
}

}  // namespace sandpipe
