#include "wireline/error.hpp"

namespace wireline {

    const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::InvalidRequest:
                return "InvalidRequest";
            case Error::Code::Resolution:
                return "Resolution";
            case Error::Code::Connect:
                return "Connect";
            case Error::Code::Tls:
                return "Tls";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::Protocol:
                return "Protocol";
            case Error::Code::PeerClosed:
                return "PeerClosed";
            case Error::Code::AuthChallenge:
                return "AuthChallenge";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::Shutdown:
                return "Shutdown";
            case Error::Code::BodyTooLarge:
                return "BodyTooLarge";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
        }
        return "Unknown";
    }

    std::string describe(const Error& error) {
        std::string out = to_string(error.code);
        out += ": ";
        out += error.message;
        if (!error.endpoint.empty()) {
            out += " [";
            out += error.endpoint;
            if (error.connection_id != 0) {
                out += " #";
                out += std::to_string(error.connection_id);
            }
            out += "]";
        }
        if (error.cause) {
            out += " (";
            out += error.cause.message();
            out += ")";
        }
        return out;
    }

}  // namespace wireline
