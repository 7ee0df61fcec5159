#pragma once

#include <string>
#include <cstdint>

namespace geotrack {

/**
 * @brief Shared-access credentials and payload signatures for sync uploads
 *
 * generate() builds a SharedAccessSignature token used as the MQTT password
 * by the MQTT sync transport. signPayload() computes the body signature sent
 * in the X-Geotrack-Signature header when http.signingKey is configured.
 */
class SasToken {
public:
    struct Config {
        std::string host;
        std::string deviceId;
        std::string deviceKeyBase64;
        uint64_t expirySeconds = 3600;
    };

    static std::string generate(const Config& config);
    static std::string generate(const std::string& host,
                               const std::string& deviceId,
                               const std::string& deviceKeyBase64,
                               uint64_t expiryEpochSeconds);

    /// @return "sha256=" followed by the lowercase hex HMAC-SHA256 of body under key
    static std::string signPayload(const std::string& key, const std::string& body);

    static std::string urlEncode(const std::string& value);
    static std::string base64Decode(const std::string& encoded);
    static std::string base64Encode(const std::string& data);
    static std::string hexEncode(const std::string& data);

    static std::string hmacSha256(const std::string& key, const std::string& message);

private:
    static std::string createStringToSign(const std::string& resourceUri, uint64_t expiry);
};

} // namespace geotrack
