#include "layer_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace geoplot::plot {

LayerRegistry::LayerRegistry(rendering::RenderBackend& backend, core::LogCallback log_callback)
    : backend_(backend), log_callback_(std::move(log_callback)) {}

LayerRegistry::~LayerRegistry() {
    // The backend only references attached primitives
    try {
        clear();
    } catch (const std::exception& ex) {
        log_message(std::string("Failed to detach layers on shutdown: ") + ex.what(), true);
    }
}

std::string LayerRegistry::set(const std::string& name, PrimitiveList primitives, bool has_explicit_style) {
    const std::string layer_name = name.empty() ? next_ordinal_name() : name;

    auto it = layers_.find(layer_name);
    if (it != layers_.end()) {
        Layer& previous = it->second;
        detach_layer(previous);

        if (!has_explicit_style && !previous.primitives.empty() && !primitives.empty() &&
            rendering::same_drawable_kind(*previous.primitives.front(), *primitives.front())) {
            const core::Style inherited = previous.primitives.front()->style();
            for (auto& primitive : primitives) {
                primitive->set_style(inherited);
            }
            log_message("Layer '" + layer_name + "' keeps the style of its previous " +
                        rendering::primitive_kind_name(primitives.front()->kind()));
        }

        previous.primitives = std::move(primitives);
        attach_layer(previous);
        log_message("Replaced layer '" + layer_name + "' (" +
                    std::to_string(previous.primitives.size()) + " primitives)");
        return layer_name;
    }

    // Registered before attaching so a failed attach can still be detached
    Layer& layer = layers_[layer_name];
    layer.primitives = std::move(primitives);
    order_.push_back(layer_name);
    attach_layer(layer);
    const std::size_t count = layer.primitives.size();
    log_message("Added layer '" + layer_name + "' (" + std::to_string(count) + " primitives)");
    return layer_name;
}

void LayerRegistry::hide(const std::string& name) {
    auto it = layers_.find(name);
    if (it == layers_.end()) {
        return;
    }
    detach_layer(it->second);
}

void LayerRegistry::show(const std::string& name) {
    auto it = layers_.find(name);
    if (it == layers_.end()) {
        return;
    }
    attach_layer(it->second);
}

void LayerRegistry::remove(const std::string& name) {
    auto it = layers_.find(name);
    if (it == layers_.end()) {
        return;
    }
    detach_layer(it->second);
    layers_.erase(it);
    order_.erase(std::find(order_.begin(), order_.end(), name));
    log_message("Removed layer '" + name + "'");
}

void LayerRegistry::clear() {
    for (auto& [name, layer] : layers_) {
        detach_layer(layer);
    }
    layers_.clear();
    order_.clear();
}

bool LayerRegistry::contains(const std::string& name) const {
    return layers_.find(name) != layers_.end();
}

bool LayerRegistry::is_visible(const std::string& name) const {
    auto it = layers_.find(name);
    return it != layers_.end() && it->second.visible;
}

const PrimitiveList& LayerRegistry::primitives(const std::string& name) const {
    return layers_.at(name).primitives;
}

std::string LayerRegistry::next_ordinal_name() {
    std::string candidate = std::to_string(next_ordinal_++);
    while (contains(candidate)) {
        candidate = std::to_string(next_ordinal_++);
    }
    return candidate;
}

void LayerRegistry::detach_layer(Layer& layer) {
    while (layer.attached > 0) {
        backend_.detach(*layer.primitives[layer.attached - 1]);
        --layer.attached;
    }
    layer.visible = false;
}

void LayerRegistry::attach_layer(Layer& layer) {
    if (layer.visible) {
        return;
    }
    layer.visible = true;
    for (; layer.attached < layer.primitives.size(); ++layer.attached) {
        backend_.attach(*layer.primitives[layer.attached]);
    }
}

void LayerRegistry::log_message(const std::string& message, bool is_error) const {
    core::log_message(log_callback_, "LayerRegistry", message, is_error);
}

} // namespace geoplot::plot
