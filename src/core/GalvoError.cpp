#include "galvo/core/GalvoError.hpp"

namespace galvo {
namespace {

class GalvoErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "galvo"; }

    std::string message(int value) const override {
        switch (static_cast<GalvoError>(value)) {
            case GalvoError::DeviceUnavailable: return "device unavailable";
            case GalvoError::PermissionDenied:  return "permission denied";
            case GalvoError::TransportFailure:  return "transport failure";
            case GalvoError::NotConnected:      return "transport failure: not connected";
            case GalvoError::ProtocolViolation: return "protocol violation: bad frame length";
        }
        return "unknown galvo error";
    }
};

} // namespace

const std::error_category& galvoCategory() noexcept {
    static const GalvoErrorCategory category;
    return category;
}

std::error_code make_error_code(GalvoError error) noexcept {
    return {static_cast<int>(error), galvoCategory()};
}

bool isTransportFailure(const std::error_code& ec) noexcept {
    return ec == GalvoError::TransportFailure || ec == GalvoError::NotConnected;
}

} // namespace galvo
