#pragma once

#include "core/DeviceTypes.h"
#include "discovery/Ipv4.h"
#include <string>

namespace BjornManager {
namespace Discovery {

// Interface class from address-range membership alone. Anything outside the USB-gadget
// and Bluetooth-PAN ranges, including unparseable addresses, is LAN.
class AddressClassifier {
public:
    AddressClassifier(Ipv4Network usbRange, Ipv4Network bluetoothRange);

    InterfaceClass classify(const std::string& address) const;

    const Ipv4Network& usbRange() const { return usbRange_; }
    const Ipv4Network& bluetoothRange() const { return bluetoothRange_; }

private:
    Ipv4Network usbRange_;
    Ipv4Network bluetoothRange_;
};

} // namespace Discovery
} // namespace BjornManager
