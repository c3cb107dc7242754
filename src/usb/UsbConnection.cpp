/**
 * @brief libusb-1.0 bulk transport for LMC galvo boards.
 */
#include "galvo/usb/UsbConnection.hpp"

#include "galvo/core/GalvoError.hpp"

#include <libusb.h>

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <vector>

namespace galvo::usb {

namespace {

std::string describeDevice(libusb_device* device, const libusb_device_descriptor& desc) {
    std::ostringstream os;
    os << "Galvo device detected: bus " << static_cast<int>(libusb_get_bus_number(device))
       << " address " << static_cast<int>(libusb_get_device_address(device))
       << std::hex << std::setfill('0')
       << " id " << std::setw(4) << desc.idVendor << ':' << std::setw(4) << desc.idProduct
       << " bcdDevice " << std::setw(4) << desc.bcdDevice
       << std::dec << " configurations " << static_cast<int>(desc.bNumConfigurations);
    return os.str();
}

} // namespace

UsbConnection::UsbConnection(std::shared_ptr<log::LogChannel> channel,
                             core::RetryPolicy transferPolicy)
: Connection(std::move(channel), transferPolicy) {
    setTimeout(config::LMC_USB_TIMEOUT);
}

UsbConnection::~UsbConnection() {
    while (!devices.empty()) {
        close(devices.begin()->first);
    }
    if (context) {
        libusb_exit(context);
        context = nullptr;
    }
}

void UsbConnection::noteBackendError(int rc, const char* step) {
    backendError = rc;
    channel()(step, ": ", libusb_error_name(rc), " (", libusb_strerror(static_cast<libusb_error>(rc)), ")");
}

expected<void> UsbConnection::ensureContext() {
    if (context) {
        return {};
    }
    const int rc = libusb_init(&context);
    if (rc != LIBUSB_SUCCESS) {
        context = nullptr;
        noteBackendError(rc, "libusb_init");
        channel()("LibUSB backend could not be initialised.");
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }
    return {};
}

expected<void> UsbConnection::findAndOpen(int index, OpenDevice& device) {
    channel()("Using LibUSB to connect.");
    channel()("Finding devices.");

    libusb_device** list = nullptr;
    const auto listed = libusb_get_device_list(context, &list);
    if (listed < 0) {
        noteBackendError(static_cast<int>(listed), "libusb_get_device_list");
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }

    std::vector<libusb_device*> candidates;
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(listed); ++i) {
        libusb_device_descriptor desc{};
        if (libusb_get_device_descriptor(list[i], &desc) != LIBUSB_SUCCESS) {
            continue;
        }
        if (desc.idVendor != config::LMC_USB_VENDOR_ID ||
            desc.idProduct != config::LMC_USB_PRODUCT_ID) {
            continue;
        }
        channel()(describeDevice(list[i], desc));
        candidates.push_back(list[i]);
    }

    if (candidates.empty()) {
        libusb_free_device_list(list, 1);
        channel()("Devices Not Found.");
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }
    if (index < 0 || static_cast<std::size_t>(index) >= candidates.size()) {
        libusb_free_device_list(list, 1);
        channel()("Galvo devices were found but they were rejected by device criteria.");
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }

    libusb_device* selected = candidates[static_cast<std::size_t>(index)];
    device.bus = libusb_get_bus_number(selected);
    device.address = libusb_get_device_address(selected);
    const int rc = libusb_open(selected, &device.handle);
    libusb_free_device_list(list, 1);

    if (rc == LIBUSB_ERROR_ACCESS) {
        noteBackendError(rc, "libusb_open");
        channel()("Your OS does not give you permissions to access USB.");
        return unexpected(make_error_code(GalvoError::PermissionDenied));
    }
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "libusb_open");
        device.handle = nullptr;
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }
    return {};
}

void UsbConnection::setConfig(OpenDevice& device) {
    channel()("Config Set");
    const int rc = libusb_set_configuration(device.handle, 1);
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "libusb_set_configuration");
        channel()("Config Set: Fail (may recover if you change where the USB is plugged in.)");
        return;
    }
    channel()("Config Set: Success");
}

expected<void> UsbConnection::detachKernel(OpenDevice& device) {
    const int active = libusb_kernel_driver_active(device.handle, config::LMC_USB_INTERFACE);
    if (active == LIBUSB_ERROR_NOT_SUPPORTED) {
        channel()("Kernel detach: Not Implemented.");
        return {};
    }
    if (active != 1) {
        return {};
    }
    channel()("Attempting to detach kernel.");
    const int rc = libusb_detach_kernel_driver(device.handle, config::LMC_USB_INTERFACE);
    if (rc == LIBUSB_ERROR_NOT_SUPPORTED) {
        channel()("Kernel detach: Not Implemented.");
        return {};
    }
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "libusb_detach_kernel_driver");
        channel()("Kernel detach: Failed.");
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }
    device.kernelDetached = true;
    channel()("Kernel detach: Success.");
    return {};
}

expected<void> UsbConnection::claimInterface(OpenDevice& device) {
    channel()("Attempting to claim interface.");
    const int rc = libusb_claim_interface(device.handle, config::LMC_USB_INTERFACE);
    if (rc == LIBUSB_SUCCESS) {
        device.claimed = true;
        channel()("Interface claim: Success");
        return {};
    }
    noteBackendError(rc, "libusb_claim_interface");
    if (rc == LIBUSB_ERROR_ACCESS) {
        return unexpected(make_error_code(GalvoError::PermissionDenied));
    }
    channel()("Interface claim: Failed. (Interface is in use.)");
    return unexpected(make_error_code(GalvoError::DeviceUnavailable));
}

expected<int> UsbConnection::open(int index) {
    channel()("Attempting connection to USB.");
    if (isOpen(index)) {
        return index;
    }
    if (auto ready = ensureContext(); !ready) {
        return unexpected(ready.error());
    }

    OpenDevice device;
    if (auto found = findAndOpen(index, device); !found) {
        channel()("Connection to USB failed.");
        return unexpected(found.error());
    }

    setConfig(device);

    if (auto detached = detachKernel(device); !detached) {
        disposeDevice(device);
        channel()("Device failed during detach and claim.");
        return unexpected(detached.error());
    }

    auto claimed = claimInterface(device);
    if (!claimed && claimed.error() == GalvoError::DeviceUnavailable) {
        // Interface cycle: release and claim once more before giving up.
        releaseInterface(device);
        claimed = claimInterface(device);
    }
    if (!claimed) {
        if (claimed.error() == GalvoError::DeviceUnavailable) {
            channel()("Galvo devices were found. But something else was connected to them.");
        }
        attachKernel(device);
        disposeDevice(device);
        channel()("Connection to USB failed.");
        return unexpected(claimed.error());
    }

    devices[index] = device;
    channel()("USB Connected.");
    return index;
}

void UsbConnection::releaseInterface(OpenDevice& device) {
    channel()("Attempting to release interface.");
    const int rc = libusb_release_interface(device.handle, config::LMC_USB_INTERFACE);
    device.claimed = false;
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "libusb_release_interface");
        channel()("Interface did not exist.");
        return;
    }
    channel()("Interface released.");
}

void UsbConnection::attachKernel(OpenDevice& device) {
    if (!device.kernelDetached) {
        return;
    }
    channel()("Attempting kernel attach");
    const int rc = libusb_attach_kernel_driver(device.handle, config::LMC_USB_INTERFACE);
    device.kernelDetached = false;
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "libusb_attach_kernel_driver");
        channel()("Kernel attach: Fail.");
        return;
    }
    channel()("Kernel attach: Success.");
}

void UsbConnection::resetDevice(OpenDevice& device) {
    channel()("Attempting USB reset.");
    const int rc = libusb_reset_device(device.handle);
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "libusb_reset_device");
        channel()("USB connection did not exist.");
        return;
    }
    channel()("USB connection reset.");
}

void UsbConnection::disposeDevice(OpenDevice& device) {
    if (!device.handle) {
        return;
    }
    channel()("Attempting to dispose resources.");
    libusb_close(device.handle);
    device.handle = nullptr;
    channel()("Dispose Resources: Success");
}

void UsbConnection::close(int index) {
    channel()("Attempting disconnection from USB.");
    auto it = devices.find(index);
    if (it == devices.end()) {
        return;
    }
    OpenDevice device = it->second;
    devices.erase(it);

    // Each step only logs its own failure so the next one still runs;
    // a claim left behind would block every later open.
    if (device.claimed) {
        releaseInterface(device);
    }
    attachKernel(device);
    resetDevice(device);
    disposeDevice(device);
    channel()("USB Disconnection Successful.");
}

bool UsbConnection::isOpen(int index) const {
    auto it = devices.find(index);
    return it != devices.end() && it->second.handle != nullptr;
}

int UsbConnection::bus(int index) const {
    auto it = devices.find(index);
    return it == devices.end() ? -1 : it->second.bus;
}

int UsbConnection::address(int index) const {
    auto it = devices.find(index);
    return it == devices.end() ? -1 : it->second.address;
}

expected<void> UsbConnection::transmit(int index, const std::uint8_t* data, std::size_t size) {
    auto it = devices.find(index);
    if (it == devices.end()) {
        return unexpected(make_error_code(GalvoError::NotConnected));
    }

    int transferred = 0;
    const int rc = libusb_bulk_transfer(it->second.handle, config::LMC_ENDPOINT_OUT,
                                        const_cast<unsigned char*>(data),
                                        static_cast<int>(size), &transferred,
                                        static_cast<unsigned int>(timeout().count()));
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "bulk write");
        return unexpected(make_error_code(GalvoError::TransportFailure));
    }
    if (static_cast<std::size_t>(transferred) != size) {
        channel()("Short bulk write: ", transferred, " of ", size, " bytes.");
        return unexpected(make_error_code(GalvoError::TransportFailure));
    }
    return {};
}

expected<lmc::ReplyBytes> UsbConnection::receive(int index) {
    auto it = devices.find(index);
    if (it == devices.end()) {
        return unexpected(make_error_code(GalvoError::NotConnected));
    }

    lmc::ReplyBytes reply{};
    int transferred = 0;
    const int rc = libusb_bulk_transfer(it->second.handle, config::LMC_ENDPOINT_IN,
                                        reply.data(), static_cast<int>(reply.size()),
                                        &transferred,
                                        static_cast<unsigned int>(timeout().count()));
    if (rc != LIBUSB_SUCCESS) {
        noteBackendError(rc, "bulk read");
        return unexpected(make_error_code(GalvoError::TransportFailure));
    }
    if (static_cast<std::size_t>(transferred) != reply.size()) {
        channel()("Short bulk read: ", transferred, " of ", reply.size(), " bytes.");
        return unexpected(make_error_code(GalvoError::TransportFailure));
    }
    return reply;
}

} // namespace galvo::usb
