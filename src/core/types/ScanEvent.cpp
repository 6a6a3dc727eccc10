#include "core/types/ScanEvent.hpp"

namespace lanscout::core {

std::string toString(ScanEventType type) {
    switch (type) {
    case ScanEventType::DeviceDiscovered:
        return "DeviceDiscovered";
    case ScanEventType::ScanProgress:
        return "ScanProgress";
    case ScanEventType::ScanningStateChanged:
        return "ScanningStateChanged";
    case ScanEventType::NextScanTimeChanged:
        return "NextScanTimeChanged";
    case ScanEventType::LastScanTimeChanged:
        return "LastScanTimeChanged";
    }
    return "Unknown";
}

} // namespace lanscout::core
