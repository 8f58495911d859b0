#include "tusgate/upload/upload_session.hpp"

#include <openssl/rand.h>

#include <array>
#include <ctime>
#include <stdexcept>

namespace tusgate {

const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::Uninitialized: return "uninitialized";
        case UploadState::Initiating: return "initiating";
        case UploadState::Appending: return "appending";
        case UploadState::Finalizing: return "finalizing";
        case UploadState::Finalized: return "finalized";
        case UploadState::Failed: return "failed";
    }
    return "uninitialized";
}

std::optional<UploadState> upload_state_from_string(const std::string& name) {
    if (name == "uninitialized") return UploadState::Uninitialized;
    if (name == "initiating") return UploadState::Initiating;
    if (name == "appending") return UploadState::Appending;
    if (name == "finalizing") return UploadState::Finalizing;
    if (name == "finalized") return UploadState::Finalized;
    if (name == "failed") return UploadState::Failed;
    return std::nullopt;
}

bool UploadSession::in_progress() const {
    return state == UploadState::Initiating || state == UploadState::Appending;
}

std::chrono::system_clock::time_point UploadSession::session_expiry(std::chrono::seconds ttl) const {
    return session_created + ttl;
}

bool UploadSession::expired(std::chrono::system_clock::time_point now,
                            std::chrono::seconds ttl) const {
    return now >= session_expiry(ttl);
}

std::string random_hex_token() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

std::string extension_of(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 == filename.size()) {
        return "";
    }
    return filename.substr(dot + 1);
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
    return buf;
}

int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_seconds(int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace tusgate
