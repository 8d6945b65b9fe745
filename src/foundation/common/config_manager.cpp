#include "eks/foundation/config_manager.hpp"

namespace eks::foundation {

ServiceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        EntryMap loaded;
        flatten("", YAML::LoadFile(path.string()), loaded);
        entries_.swap(loaded);
        return ServiceResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    } catch (const YAML::Exception& e) {
        return ServiceResult<void>::err(ServiceError(
            ErrorCode::ConfigLoadFailed, std::string("unusable YAML in ") + path.string() + ": " + e.what()));
    }
}

ServiceResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        EntryMap loaded;
        flatten("", YAML::Load(std::string(yaml)), loaded);
        entries_.swap(loaded);
        return ServiceResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    } catch (const YAML::Exception& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("unusable YAML: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node, EntryMap& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else if (!prefix.empty()) {
        // Leaf (scalar, sequence or null): store under its dotted key.
        out[prefix] = YAML::Clone(node);
    }
}

}  // namespace eks::foundation
