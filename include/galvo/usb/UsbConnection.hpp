#pragma once

#include "galvo/usb/Connection.hpp"

#include <map>

struct libusb_context;
struct libusb_device_handle;

namespace galvo::usb {

/**
 * @brief libusb-1.0 transport for LMC boards (vendor 0x9588, product 0x9899).
 *
 * Opening enumerates every matching board, logs each one, picks the
 * `index`-th, selects the default configuration, detaches an active kernel
 * driver and claims interface 0. A failed claim gets one release/claim cycle.
 *
 * The libusb context is created on the first open and released in the
 * destructor, after every still-open index has been closed.
 */
class UsbConnection : public Connection {
public:
    explicit UsbConnection(std::shared_ptr<log::LogChannel> channel = nullptr,
                           core::RetryPolicy transferPolicy = {config::LMC_TRANSFER_ATTEMPTS,
                                                               config::LMC_TRANSFER_BACKOFF});
    ~UsbConnection() override;

    expected<int> open(int index) override;
    void close(int index) override;
    bool isOpen(int index) const override;

    int bus(int index) const;
    int address(int index) const;

    /// libusb error code of the last failing backend call (0 if none).
    int lastBackendError() const { return backendError; }

protected:
    expected<void> transmit(int index, const std::uint8_t* data, std::size_t size) override;
    expected<lmc::ReplyBytes> receive(int index) override;

private:
    struct OpenDevice {
        libusb_device_handle* handle = nullptr;
        bool kernelDetached = false;
        bool claimed = false;
        int bus = -1;
        int address = -1;
    };

    expected<void> ensureContext();
    /// Enumerate matching boards and open the index-th one into @p device.
    expected<void> findAndOpen(int index, OpenDevice& device);
    void setConfig(OpenDevice& device);
    expected<void> detachKernel(OpenDevice& device);
    expected<void> claimInterface(OpenDevice& device);

    void releaseInterface(OpenDevice& device);
    void attachKernel(OpenDevice& device);
    void resetDevice(OpenDevice& device);
    void disposeDevice(OpenDevice& device);

    void noteBackendError(int rc, const char* step);

    libusb_context* context = nullptr;
    std::map<int, OpenDevice> devices;
    int backendError = 0;
};

} // namespace galvo::usb
