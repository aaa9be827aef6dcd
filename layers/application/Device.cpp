#include "Device.h"

#include <boost/asio/ip/address_v4.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace application {

namespace {

std::string trim(const std::string& text) {
    const auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    const auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

bool isValidHost(const std::string& host, std::string& error) {
    if (host.empty() || host.size() > 253) {
        error = "Host is empty or too long";
        return false;
    }
    if (host.front() == '.' || host.front() == '-' || host.back() == '.' || host.back() == '-') {
        error = "Host has a leading or trailing separator: " + host;
        return false;
    }

    if (host.find("..") != std::string::npos) {
        error = "Host has an empty label: " + host;
        return false;
    }

    const bool allowedChars = std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '.' || c == '-';
    });
    if (!allowedChars) {
        error = "Host contains invalid characters: " + host;
        return false;
    }

    const bool numeric = std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isdigit(c) != 0 || c == '.';
    });
    if (numeric) {
        boost::system::error_code ec;
        boost::asio::ip::make_address_v4(host, ec);
        if (ec) {
            error = "Invalid IPv4 address: " + host;
            return false;
        }
    }
    return true;
}

} // namespace

const char* toString(DeviceSource source) noexcept {
    return source == DeviceSource::Configuration ? "config" : "discovery";
}

bool normalizeAddress(const std::string& raw, std::string& normalized, std::string& error) {
    const auto text = trim(raw);
    if (text.empty()) {
        error = "Address is empty";
        return false;
    }

    std::string host = text;
    std::uint16_t port = kDefaultAdbPort;

    const auto colon = text.find(':');
    if (colon != std::string::npos) {
        if (text.find(':', colon + 1) != std::string::npos) {
            error = "IPv6 addresses are not supported: " + text;
            return false;
        }
        host = text.substr(0, colon);
        const auto portText = text.substr(colon + 1);

        unsigned int parsed = 0;
        const auto* begin = portText.data();
        const auto* end = begin + portText.size();
        const auto res = std::from_chars(begin, end, parsed);
        if (portText.empty() || res.ec != std::errc() || res.ptr != end || parsed == 0 || parsed > 0xFFFF) {
            error = "Invalid port in address: " + text;
            return false;
        }
        port = static_cast<std::uint16_t>(parsed);
    }

    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (!isValidHost(host, error)) {
        return false;
    }

    normalized = host + ":" + std::to_string(port);
    return true;
}

std::string deviceIdFromAddress(const std::string& normalizedAddress) {
    std::string host = normalizedAddress;
    std::string port;
    const auto colon = normalizedAddress.find(':');
    if (colon != std::string::npos) {
        host = normalizedAddress.substr(0, colon);
        port = normalizedAddress.substr(colon + 1);
    }

    // Hosts never contain '_' or "..", so '.' -> '_' and a "__port" suffix stay unambiguous.
    std::replace(host.begin(), host.end(), '.', '_');
    if (!port.empty() && port != std::to_string(kDefaultAdbPort)) {
        host += "__" + port;
    }
    return host;
}

} // namespace application
