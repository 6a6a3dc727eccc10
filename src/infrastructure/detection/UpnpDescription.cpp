#include "infrastructure/detection/UpnpDescription.hpp"

#include "infrastructure/detection/TextMatch.hpp"

#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include <cstring>
#include <vector>

namespace lanscout::infra {

namespace {

const char* localName(const char* qualified) {
    const char* colon = std::strrchr(qualified, ':');
    return colon ? colon + 1 : qualified;
}

std::string childText(const pugi::xml_node& parent, const char* name) {
    for (auto child : parent.children()) {
        if (child.type() == pugi::node_element && std::strcmp(localName(child.name()), name) == 0) {
            return text::trim(child.text().as_string());
        }
    }
    return {};
}

} // namespace

std::optional<UpnpDescription> UpnpDescription::parse(const std::string& xml) {
    pugi::xml_document doc;
    unsigned int flags = pugi::parse_default & ~pugi::parse_doctype;
    auto result = doc.load_buffer(xml.data(), xml.size(), flags, pugi::encoding_utf8);
    if (!result) {
        spdlog::debug("UPnP description is not valid XML: {}", result.description());
        return std::nullopt;
    }

    auto device = doc.find_node([](const pugi::xml_node& node) {
        return node.type() == pugi::node_element &&
               std::strcmp(localName(node.name()), "device") == 0;
    });
    if (!device) {
        return std::nullopt;
    }

    UpnpDescription description;
    description.friendlyName = childText(device, "friendlyName");
    description.manufacturer = childText(device, "manufacturer");
    description.modelName = childText(device, "modelName");
    description.deviceType = childText(device, "deviceType");
    return description;
}

std::optional<std::string> UpnpDescription::deviceTypeHint(const std::string& deviceType) {
    auto lower = text::toLower(deviceType);

    if (text::contains(lower, "mediaserver")) {
        return "Media Server";
    }
    if (text::contains(lower, "mediarenderer")) {
        return "Media Renderer";
    }
    if (text::contains(lower, "printer")) {
        return "Printer";
    }
    if (text::contains(lower, "scanner")) {
        return "Scanner";
    }
    if (text::containsAny(lower, {"router", "gateway"})) {
        return "Router/Gateway";
    }
    if (text::containsAny(lower, {"tv", "television"})) {
        return "Smart TV";
    }
    if (text::contains(lower, "light")) {
        return "Smart Light";
    }
    if (text::contains(lower, "thermostat")) {
        return "Thermostat";
    }
    if (text::contains(lower, "camera")) {
        return "Camera";
    }
    if (text::contains(lower, "storage")) {
        return "Network Storage";
    }
    return std::nullopt;
}

std::string UpnpDescription::buildLabel() const {
    std::vector<std::string> parts;

    if (!friendlyName.empty() && friendlyName != manufacturer) {
        parts.push_back(friendlyName);
    } else if (!manufacturer.empty() && !modelName.empty()) {
        parts.push_back(manufacturer + " " + modelName);
    } else if (!modelName.empty()) {
        parts.push_back(modelName);
    } else if (!manufacturer.empty()) {
        parts.push_back(manufacturer);
    }

    if (auto hint = deviceTypeHint(deviceType)) {
        parts.push_back(*hint);
    }

    if (parts.empty()) {
        return "UPnP Device";
    }

    std::string label = parts.front();
    for (size_t i = 1; i < parts.size(); ++i) {
        label += " - " + parts[i];
    }
    return label + " (UPnP)";
}

} // namespace lanscout::infra
