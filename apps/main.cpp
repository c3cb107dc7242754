#include "galvo/lmc/GalvoController.hpp"
#include "galvo/usb/MockConnection.hpp"
#include "galvo/usb/UsbConnection.hpp"

#include <cmath>
#include <cstring>
#include <memory>

using namespace galvo;

int main(int argc, char** argv) {
    lmc::DeviceConfig config;
    config.mock = true;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--usb") == 0) {
            config.mock = false;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        }
    }

    lmc::GalvoController controller(config);

    if (config.mock) {
        // Keep a handle on the simulator so its traffic can be printed.
        controller.setConnectionFactory(
            [verbose](const lmc::DeviceConfig& cfg, std::shared_ptr<log::LogChannel> channel) {
                auto mock = std::make_shared<usb::MockConnection>(std::move(channel),
                                                                  cfg.transferPolicy);
                if (verbose) {
                    mock->setSendHandler([](std::string_view text) {
                        logInfo("[send] ", text, "\n");
                    });
                    mock->setRecvHandler([](std::string_view text) {
                        logInfo("[recv] ", text, "\n");
                    });
                }
                return mock;
            });
    }

    auto connectedOk = controller.connectIfNeeded();
    auto* usbDevice = dynamic_cast<usb::UsbConnection*>(controller.connection());
    if (!connectedOk) {
        logError("Connect failed: ", connectedOk.error().message(), "\n");
        if (usbDevice && usbDevice->lastBackendError() != 0) {
            logError("libusb error ", usbDevice->lastBackendError(), "\n");
        }
        return 1;
    }
    if (usbDevice) {
        logInfo("Board ", config.machineIndex, " on bus ", usbDevice->bus(config.machineIndex),
                " address ", usbDevice->address(config.machineIndex), "\n");
    }

    lmc::OperationSettings settings;
    settings.speed = 500.0;
    settings.power = 40.0;
    settings.frequency = 25.0;

    if (auto r = controller.programMode(); !r) {
        logError("Program mode failed: ", r.error().message(), "\n");
        return 1;
    }
    if (auto r = controller.setSettings(settings); !r) {
        logError("Settings failed: ", r.error().message(), "\n");
        return 1;
    }

    // 20 mm circle around the field centre.
    const double unitsPerMm = config.unitsPerMm();
    const double radius = 10.0 * unitsPerMm;
    const double centre = 0x8000;
    constexpr int kSegments = 72;
    const double tau = 2.0 * std::acos(-1.0);

    if (auto r = controller.gotoXY(centre + radius, centre); !r) {
        logError("Jump failed: ", r.error().message(), "\n");
        return 1;
    }
    for (int i = 1; i <= kSegments; ++i) {
        const double angle = tau * i / kSegments;
        auto r = controller.mark(centre + radius * std::cos(angle),
                                 centre + radius * std::sin(angle));
        if (!r) {
            logError("Mark failed: ", r.error().message(), "\n");
            return 1;
        }
    }

    if (auto r = controller.rapidMode(); !r) {
        logError("Rapid mode failed: ", r.error().message(), "\n");
        return 1;
    }

    const auto pos = controller.lastXY();
    logInfo("Job sent. Last position ", pos.x, ",", pos.y, "\n");
    controller.disconnect();
    return 0;
}
