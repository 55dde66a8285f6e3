#include "apps_document.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include "widget_loader.hpp"

namespace bridge::registry {

    AppsDocument AppsLoader::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            return AppsDocument::array();
        }
        if (!std::filesystem::is_regular_file(path)) {
            throw RegistryError("Apps file is not a regular file: " + path.string());
        }

        std::ifstream in(path);
        if (!in) {
            throw RegistryError("Could not read apps file: " + path.string());
        }
        std::ostringstream contents;
        contents << in.rdbuf();

        return parse_json(contents.str());
    }

    AppsDocument AppsLoader::parse_json(std::string_view json) {
        AppsDocument doc;
        try {
            doc = AppsDocument::parse(json);
        } catch (const AppsDocument::parse_error& e) {
            throw RegistryError(std::string("Apps file is not valid JSON: ") + e.what());
        }

        if (!doc.is_array()) {
            throw RegistryError("Apps file must contain a JSON array");
        }
        for (size_t i = 0; i < doc.size(); ++i) {
            const auto& app = doc[i];
            if (!app.is_object() || !app.contains("name") || !app["name"].is_string()) {
                throw RegistryError("apps[" + std::to_string(i) + "]: Invalid app name");
            }
        }
        return doc;
    }

}  // namespace bridge::registry
