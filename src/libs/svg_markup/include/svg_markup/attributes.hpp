#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace svg_markup {

// Insertion-ordered element attributes. Names are unique: once a name is set,
// later writes to it are rejected and the first value is kept.
class AttributeList {
public:
    using Entry = std::pair<std::string, std::string>;

    bool set(const std::string& name, std::string value);
    bool set_number(const std::string& name, double value);

    bool contains(const std::string& name) const;
    const std::string* find(const std::string& name) const;

    // Appends every entry of `other` whose name is not present yet.
    // Returns the names that were skipped because they collided.
    std::vector<std::string> merge(const AttributeList& other);

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    const std::vector<Entry>& entries() const { return entries_; }

    // name="value" pairs joined by single spaces, values escaped.
    std::string to_string() const;

private:
    std::vector<Entry> entries_;
};

// Shortest round-trip decimal form: 0, 100, 0.6, -12.25. Negative zero prints as 0.
std::string format_number(double value);

// Numbers joined with `separator`, each through format_number.
std::string join_numbers(const std::vector<double>& values, const char* separator);

std::string escape_attribute(const std::string& value);
std::string escape_text(const std::string& text);

// <tag attrs /> when content is absent, <tag attrs>content</tag> otherwise.
// Content is written verbatim; callers escape text content themselves.
std::string make_element(const std::string& tag, const AttributeList& attributes,
    const std::optional<std::string>& content = std::nullopt);

} // namespace svg_markup
