#include "widget_registry.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace bridge::registry {

    WidgetRegistry::WidgetRegistry(std::vector<WidgetDescriptor> widgets) {
        widgets_.reserve(widgets.size());
        for (auto& widget : widgets) {
            add(std::move(widget));
        }
    }

    void WidgetRegistry::add(WidgetDescriptor widget) {
        if (widget.id_.empty()) {
            throw std::invalid_argument("Widget id must not be empty");
        }
        if (index_.find(widget.id_) != index_.end()) {
            throw std::invalid_argument("Duplicate widget id: " + widget.id_);
        }

        index_.emplace(widget.id_, widgets_.size());
        widgets_.emplace_back(std::move(widget));
    }

    const WidgetDescriptor* WidgetRegistry::find(const std::string& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return nullptr;
        }
        return &widgets_[it->second];
    }

}  // namespace bridge::registry
