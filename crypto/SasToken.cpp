#include "SasToken.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <algorithm>
#include <cctype>

namespace geotrack {

std::string SasToken::generate(const Config& config) {
    uint64_t expiry = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count() + config.expirySeconds;

    return generate(config.host, config.deviceId, config.deviceKeyBase64, expiry);
}

/**
 * @brief Build a token for host/devices/deviceId valid until expiryEpochSeconds
 *
 * The resource URI uses the lowercased host. The signature is the Base64
 * HMAC-SHA256 of the URL-encoded URI and expiry, keyed with the decoded
 * device key.
 */
std::string SasToken::generate(const std::string& host,
                              const std::string& deviceId,
                              const std::string& deviceKeyBase64,
                              uint64_t expiryEpochSeconds) {
    std::string lowerHost = host;
    std::transform(lowerHost.begin(), lowerHost.end(), lowerHost.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string resourceUri = lowerHost + "/devices/" + deviceId;

    std::string stringToSign = createStringToSign(resourceUri, expiryEpochSeconds);
    std::string signature = hmacSha256(base64Decode(deviceKeyBase64), stringToSign);

    std::stringstream token;
    token << "SharedAccessSignature sr=" << urlEncode(resourceUri)
          << "&sig=" << urlEncode(base64Encode(signature))
          << "&se=" << expiryEpochSeconds;

    return token.str();
}

std::string SasToken::signPayload(const std::string& key, const std::string& body) {
    return "sha256=" + hexEncode(hmacSha256(key, body));
}

std::string SasToken::createStringToSign(const std::string& resourceUri, uint64_t expiry) {
    return urlEncode(resourceUri) + "\n" + std::to_string(expiry);
}

std::string SasToken::hmacSha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    // Output goes to a local buffer; HMAC's static buffer is not thread-safe.
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.length()),
         reinterpret_cast<const unsigned char*>(message.data()), message.length(),
         digest, &digestLength);

    return std::string(reinterpret_cast<const char*>(digest), digestLength);
}

std::string SasToken::base64Encode(const std::string& data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.length()));
    (void)BIO_flush(bio);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

// Returns an empty string when the input is not valid Base64.
std::string SasToken::base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.length()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string result(encoded.length(), 0);
    int decodedLength = BIO_read(bio, &result[0], static_cast<int>(result.size()));

    BIO_free_all(bio);

    if (decodedLength > 0) {
        result.resize(decodedLength);
    } else {
        result.clear();
    }

    return result;
}

std::string SasToken::hexEncode(const std::string& data) {
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned char c : data) {
        hex << std::setw(2) << static_cast<int>(c);
    }
    return hex.str();
}

// RFC 3986: unreserved characters pass through, everything else is %XX.
std::string SasToken::urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

} // namespace geotrack
