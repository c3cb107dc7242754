#pragma once

#include <string>
#include <system_error>

namespace galvo {

/**
 * @brief Failure taxonomy of the driver.
 *
 * Values are reported as `std::error_code` in the "galvo" category so they
 * travel through `galvo::expected` next to OS and std::errc codes.
 */
enum class GalvoError {
    DeviceUnavailable = 1,  ///< not found, rejected, in use, or reconnect budget spent
    PermissionDenied,       ///< the OS refused access to the device
    TransportFailure,       ///< transfer failed after all retries
    NotConnected,           ///< transfer on an index that is not open
    ProtocolViolation       ///< frame of the wrong length; never retried
};

const std::error_category& galvoCategory() noexcept;

std::error_code make_error_code(GalvoError error) noexcept;

/// True for TransportFailure and its NotConnected variant.
bool isTransportFailure(const std::error_code& ec) noexcept;

} // namespace galvo

namespace std {
template <>
struct is_error_code_enum<galvo::GalvoError> : true_type {};
} // namespace std
