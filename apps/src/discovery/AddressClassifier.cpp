#include "discovery/AddressClassifier.h"

namespace BjornManager {
namespace Discovery {

AddressClassifier::AddressClassifier(Ipv4Network usbRange, Ipv4Network bluetoothRange)
    : usbRange_(usbRange), bluetoothRange_(bluetoothRange)
{}

InterfaceClass AddressClassifier::classify(const std::string& address) const
{
    const auto parsed = Ipv4Address::parse(address);
    if (!parsed.has_value()) {
        return InterfaceClass::Lan;
    }
    if (usbRange_.contains(parsed.value())) {
        return InterfaceClass::Usb;
    }
    if (bluetoothRange_.contains(parsed.value())) {
        return InterfaceClass::Bluetooth;
    }
    return InterfaceClass::Lan;
}

} // namespace Discovery
} // namespace BjornManager
