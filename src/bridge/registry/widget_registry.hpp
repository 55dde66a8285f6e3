#ifndef NEXUS_BRIDGE_REGISTRY_WIDGET_REGISTRY_HPP
#define NEXUS_BRIDGE_REGISTRY_WIDGET_REGISTRY_HPP

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "widget.hpp"

namespace bridge::registry {

    // Widgets keyed by id, iterated in the order they were added. Built once at startup and then only read.
    class WidgetRegistry {
       public:
        WidgetRegistry() = default;
        explicit WidgetRegistry(std::vector<WidgetDescriptor> widgets);

        // Throws std::invalid_argument on an empty or duplicate id.
        void add(WidgetDescriptor widget);

        [[nodiscard]] const WidgetDescriptor* find(const std::string& id) const;
        [[nodiscard]] const std::vector<WidgetDescriptor>& widgets() const { return widgets_; }
        [[nodiscard]] size_t size() const { return widgets_.size(); }
        [[nodiscard]] bool empty() const { return widgets_.empty(); }

       private:
        std::vector<WidgetDescriptor> widgets_;
        std::unordered_map<std::string, size_t> index_;
    };

}  // namespace bridge::registry

#endif
