#include "npc/foundation/config_manager.hpp"

#include "npc/foundation/npc_logger.hpp"

namespace npc::foundation {

NpcResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        NPC_LOG_INFO(LogCategory::Config, "loaded configuration from " + path.string());
        return NpcResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return NpcResult<void>::err(
            NpcError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return NpcResult<void>::err(
            NpcError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

NpcResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return NpcResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return NpcResult<void>::err(
            NpcError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null), stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    auto it = watchers_.find(std::string(key));
    if (it != watchers_.end()) {
        for (auto& cb : it->second) {
            cb(key);
        }
    }
}

}  // namespace npc::foundation
