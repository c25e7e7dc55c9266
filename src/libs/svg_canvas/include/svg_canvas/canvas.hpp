#pragma once

#include <svg_components/component.hpp>
#include <svg_components/nested_document.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace svg_canvas {

struct ViewBox {
    double min_x = 0;
    double min_y = 0;
    double width = 0;
    double height = 0;
};

// Ordered, owning collection of components wrapped in an <svg> envelope.
// Insertion order is paint order: later components draw over earlier ones.
class Canvas {
public:
    // Throws svg_geometry::GeometryError unless width and height are positive and finite.
    Canvas(double width, double height);

    double width() const { return width_; }
    double height() const { return height_; }

    // Defaults to 0 0 width height.
    const ViewBox& view_box() const { return view_box_; }
    void set_view_box(const ViewBox& view_box);

    // Takes ownership; returns the stored component so it can still be chained.
    // Throws std::invalid_argument for a null pointer.
    svg_components::Component& add(std::unique_ptr<svg_components::Component> component);

    template <class T, class... Args>
    T& emplace(Args&&... args) {
        auto owned = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *owned;
        add(std::move(owned));
        return ref;
    }

    std::size_t size() const { return components_.size(); }
    bool empty() const { return components_.empty(); }
    const std::vector<std::unique_ptr<svg_components::Component>>& components() const { return components_; }
    void clear() { components_.clear(); }

    // Full document: envelope plus one indented child per line.
    std::string render() const;
    // Children only, one per line, no envelope.
    std::string render_body() const;
    // This canvas's body as an inner <svg> placed at (x, y) with the canvas size.
    svg_components::NestedDocument to_nested_document(double x = 0, double y = 0) const;

    // Writes render() to `path`, creating missing parent directories.
    // Returns false and logs the reason on failure.
    bool save(const std::string& path) const;

private:
    double width_;
    double height_;
    ViewBox view_box_;
    std::vector<std::unique_ptr<svg_components::Component>> components_;
};

} // namespace svg_canvas
