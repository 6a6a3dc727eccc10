/**
 * @file UpnpDescription.hpp
 * @brief Root device fields from a UPnP device description document.
 */

#pragma once

#include <optional>
#include <string>

namespace lanscout::infra {

/**
 * @brief The identifying fields of the first <device> element.
 */
struct UpnpDescription {
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    std::string deviceType; ///< URN, e.g. "urn:schemas-upnp-org:device:MediaRenderer:1"

    /**
     * @brief Parses description XML. Element matching ignores namespaces.
     * @return nullopt for malformed XML or a document without a device element.
     */
    static std::optional<UpnpDescription> parse(const std::string& xml);

    /**
     * @brief Builds the label, e.g. "Living Room TV - Media Renderer (UPnP)".
     */
    [[nodiscard]] std::string buildLabel() const;

    /**
     * @brief Maps a device type URN to a readable category.
     */
    static std::optional<std::string> deviceTypeHint(const std::string& deviceType);
};

} // namespace lanscout::infra
