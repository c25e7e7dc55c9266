#include <svg_markup/attributes.hpp>
#include <svg_logging/logging.hpp>
#include <spdlog/fmt/fmt.h>

namespace svg_markup {

namespace {

std::string escape(const std::string& in, bool quote) {
    std::string out;
    out.reserve(in.size());
    for (char ch : in) {
        switch (ch) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"':
            if (quote) out += "&quot;";
            else out += ch;
            break;
        default: out += ch; break;
        }
    }
    return out;
}

} // namespace

bool AttributeList::set(const std::string& name, std::string value) {
    if (contains(name)) return false;
    entries_.emplace_back(name, std::move(value));
    return true;
}

bool AttributeList::set_number(const std::string& name, double value) {
    return set(name, format_number(value));
}

bool AttributeList::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const std::string* AttributeList::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return &entry.second;
    }
    return nullptr;
}

std::vector<std::string> AttributeList::merge(const AttributeList& other) {
    std::vector<std::string> skipped;
    for (const auto& entry : other.entries_) {
        if (!set(entry.first, entry.second)) {
            svg_logging::logger()->warn("attribute_collision name={} kept={} dropped={}",
                entry.first, *find(entry.first), entry.second);
            skipped.push_back(entry.first);
        }
    }
    return skipped;
}

std::string AttributeList::to_string() const {
    std::string out;
    for (const auto& entry : entries_) {
        if (!out.empty()) out += ' ';
        out += entry.first;
        out += "=\"";
        out += escape_attribute(entry.second);
        out += '"';
    }
    return out;
}

std::string format_number(double value) {
    if (value == 0.0) return "0";
    return fmt::format("{}", value);
}

std::string join_numbers(const std::vector<double>& values, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += separator;
        out += format_number(values[i]);
    }
    return out;
}

std::string escape_attribute(const std::string& value) {
    return escape(value, true);
}

std::string escape_text(const std::string& text) {
    return escape(text, false);
}

std::string make_element(const std::string& tag, const AttributeList& attributes,
    const std::optional<std::string>& content)
{
    std::string out = "<" + tag;
    if (!attributes.empty()) {
        out += ' ';
        out += attributes.to_string();
    }
    if (!content) {
        out += " />";
        return out;
    }
    out += '>';
    out += *content;
    out += "</" + tag + ">";
    return out;
}

} // namespace svg_markup
