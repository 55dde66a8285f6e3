#ifndef NEXUS_BRIDGE_REGISTRY_APPS_DOCUMENT_HPP
#define NEXUS_BRIDGE_REGISTRY_APPS_DOCUMENT_HPP

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace bridge::registry {

    // Workspace app layouts, served verbatim from /apps.json. Key order is kept as written.
    using AppsDocument = nlohmann::ordered_json;

    class AppsLoader {
       public:
        // A missing file is an empty app list. Throws RegistryError when the file exists but is unreadable or malformed.
        [[nodiscard]] static AppsDocument load_from_file(const std::filesystem::path& path);
        // The document must be a JSON array of objects, each with a string "name".
        [[nodiscard]] static AppsDocument parse_json(std::string_view json);
    };

}  // namespace bridge::registry

#endif
