#pragma once

#include "dispatcher.hpp"

#include "core/log.hpp"
#include "rendering/render_backend.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace geoplot::plot {

// Named groups of primitives on a backend. A layer is visible (attached),
// hidden (detached but kept) or absent. The registry owns every primitive it
// stores and detaches it before destroying it.
class LayerRegistry {
public:
    explicit LayerRegistry(rendering::RenderBackend& backend, core::LogCallback log_callback = nullptr);
    ~LayerRegistry();

    LayerRegistry(const LayerRegistry&) = delete;
    LayerRegistry& operator=(const LayerRegistry&) = delete;

    // Installs `primitives` under `name` (an ordinal name when empty) and makes
    // the layer visible. An existing layer is hidden and replaced; when
    // `has_explicit_style` is false and the new primitives are the same
    // drawable kind as the old ones, they take over the old layer's style.
    // Returns the layer name.
    std::string set(const std::string& name, PrimitiveList primitives, bool has_explicit_style);

    // hide/show/remove are no-ops for unknown names.
    void hide(const std::string& name);
    void show(const std::string& name);
    void remove(const std::string& name);
    void clear();

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] bool is_visible(const std::string& name) const;
    [[nodiscard]] std::size_t size() const { return layers_.size(); }
    [[nodiscard]] const std::vector<std::string>& names() const { return order_; }

    // Throws std::out_of_range for an unknown name.
    [[nodiscard]] const PrimitiveList& primitives(const std::string& name) const;

private:
    struct Layer {
        PrimitiveList primitives;
        bool visible = false;
        // Leading primitives currently held by the backend
        std::size_t attached = 0;
    };

    rendering::RenderBackend& backend_;
    core::LogCallback log_callback_;
    std::unordered_map<std::string, Layer> layers_;
    std::vector<std::string> order_;
    std::size_t next_ordinal_ = 0;

    std::string next_ordinal_name();
    void detach_layer(Layer& layer);
    void attach_layer(Layer& layer);
    void log_message(const std::string& message, bool is_error = false) const;
};

} // namespace geoplot::plot
