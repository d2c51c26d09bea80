#include "memboot/registry.hpp"
#include "memboot/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace memboot {

namespace {

using ordered_json = nlohmann::ordered_json;

ordered_json entry_to_json(const RegistryEntry& entry) {
    ordered_json value;
    value["source"] = {{"source", "directory"}, {"path", entry.source_path}};
    value["installLocation"] = entry.install_location;
    value["lastUpdated"] = entry.last_updated;
    return value;
}

std::string serialize(const ordered_json& j) {
    return j.dump(2) + "\n";
}

} // namespace

RegistryMergeResult merge_registry_entry(const std::string& path, const RegistryEntry& entry) {
    RegistryMergeResult result;

    if (entry.key.empty()) {
        result.error = "registry key is empty";
        return result;
    }

    if (!path_exists(path)) {
        auto init = atomic_write_file(path, serialize(ordered_json::object()));
        if (!init.ok) {
            result.error = "cannot create " + path + ": " + init.error;
            return result;
        }
        result.created_file = true;
        spdlog::debug("created empty registry {}", path);
    }

    auto content = read_file(path);
    if (!content) {
        result.error = "cannot read " + path;
        return result;
    }

    ordered_json registry;
    try {
        registry = ordered_json::parse(*content);
    } catch (const ordered_json::parse_error& e) {
        result.error = path + " is not valid JSON: " + e.what();
        return result;
    }

    if (!registry.is_object()) {
        result.error = path + " does not contain a JSON object";
        return result;
    }

    if (registry.contains(entry.key)) {
        result.status = RegistryMergeStatus::AlreadyPresent;
        return result;
    }

    registry[entry.key] = entry_to_json(entry);

    auto write = atomic_write_file(path, serialize(registry));
    if (!write.ok) {
        result.error = "cannot write " + path + ": " + write.error;
        return result;
    }

    result.status = RegistryMergeStatus::Added;
    return result;
}

StepResult register_marketplace(const InstallConfig& config) {
    RegistryEntry entry;
    entry.key = config.identity.marketplace_id;
    entry.source_path = config.paths.marketplace_dir;
    entry.install_location = config.paths.marketplace_dir;
    entry.last_updated = get_current_timestamp();

    auto result = merge_registry_entry(config.paths.registry_file, entry);
    switch (result.status) {
        case RegistryMergeStatus::AlreadyPresent:
            return StepResult::already_satisfied("Marketplace already registered");
        case RegistryMergeStatus::Added:
            return StepResult::ok("Marketplace registered");
        case RegistryMergeStatus::Error:
        default:
            return StepResult::warning(ErrorKind::RegistryWriteError,
                                       result.error + " - manually add " + entry.key + " to " +
                                           config.paths.registry_file);
    }
}

} // namespace memboot
