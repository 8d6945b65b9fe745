/// @file wire_codec.cpp
/// @brief JSON encoding and decoding over nlohmann/json.

#include "eks/service/wire_codec.hpp"

#include <optional>

#include <nlohmann/json.hpp>

namespace eks::service::wire {

using foundation::Bytes;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;
using json = nlohmann::json;

namespace {

json bytesToJson(const Bytes& bytes) {
    json arr = json::array();
    for (uint8_t b : bytes) {
        arr.push_back(b);
    }
    return arr;
}

std::optional<Bytes> bytesFromJson(const json& value) {
    if (!value.is_array()) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_number_integer()) {
            return std::nullopt;
        }
        auto n = item.get<int64_t>();
        if (n < 0 || n > 255) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>(n));
    }
    return out;
}

// Invalid UTF-8 is replaced instead of throwing.
std::string serialize(const json& doc) {
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

ServiceError invalid(std::string what) {
    return ServiceError(ErrorCode::InvalidRequest, std::move(what));
}

/// Parse @p body into an object, or explain why it is not one.
std::optional<json> parseObject(std::string_view body, std::string& why) {
    json doc = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        why = "body is not valid JSON";
        return std::nullopt;
    }
    if (!doc.is_object()) {
        why = "body must be a JSON object";
        return std::nullopt;
    }
    return doc;
}

std::optional<Bytes> bytesMember(const json& obj, const char* member, std::string& why) {
    auto it = obj.find(member);
    if (it == obj.end()) {
        why = std::string("missing field `") + member + "`";
        return std::nullopt;
    }
    auto bytes = bytesFromJson(*it);
    if (!bytes) {
        why = std::string("field `") + member + "` must be an array of bytes";
    }
    return bytes;
}

}  // anonymous namespace

ServiceResult<ChallengeRequest> decodeChallengeRequest(std::string_view body) {
    std::string why;
    auto doc = parseObject(body, why);
    if (!doc) {
        return ServiceResult<ChallengeRequest>::err(invalid(why));
    }

    auto it = doc->find("pubkey");
    if (it == doc->end()) {
        return ServiceResult<ChallengeRequest>::err(invalid("missing field `pubkey`"));
    }

    ChallengeRequest request;
    if (it->is_string()) {
        const auto& pem = it->get_ref<const std::string&>();
        request.pubkey.format = EncodedPublicKey::Format::Pem;
        request.pubkey.data = foundation::toBytes(pem);
    } else if (auto der = bytesFromJson(*it)) {
        request.pubkey.format = EncodedPublicKey::Format::Der;
        request.pubkey.data = std::move(*der);
    } else {
        return ServiceResult<ChallengeRequest>::err(
            invalid("field `pubkey` must be a byte array or a PEM string"));
    }
    return ServiceResult<ChallengeRequest>::ok(std::move(request));
}

ServiceResult<ChallengeResponse> decodeChallengeResponse(std::string_view body) {
    std::string why;
    auto doc = parseObject(body, why);
    if (!doc) {
        return ServiceResult<ChallengeResponse>::err(invalid(why));
    }

    ChallengeResponse response;
    auto responseBytes = bytesMember(*doc, "response", why);
    if (!responseBytes) {
        return ServiceResult<ChallengeResponse>::err(invalid(why));
    }
    auto state = bytesMember(*doc, "state", why);
    if (!state) {
        return ServiceResult<ChallengeResponse>::err(invalid(why));
    }
    auto nonce = bytesMember(*doc, "nonce", why);
    if (!nonce) {
        return ServiceResult<ChallengeResponse>::err(invalid(why));
    }

    auto name = doc->find("name");
    if (name == doc->end() || !name->is_string()) {
        return ServiceResult<ChallengeResponse>::err(invalid("field `name` must be a string"));
    }

    response.response = std::move(*responseBytes);
    response.state = std::move(*state);
    response.nonce = std::move(*nonce);
    response.name = name->get<std::string>();
    return ServiceResult<ChallengeResponse>::ok(std::move(response));
}

std::string encodeChallenge(const Challenge& challenge) {
    json doc = {
        {"challenge", bytesToJson(challenge.challenge)},
        {"state", bytesToJson(challenge.state)},
        {"nonce", bytesToJson(challenge.nonce)},
    };
    return serialize(doc);
}

std::string encodePublicKey(const Bytes& der) {
    json doc = {{"pubkey", bytesToJson(der)}};
    return serialize(doc);
}

std::string encodeError(std::string_view message) {
    json doc = {{"error", std::string(message)}};
    return serialize(doc);
}

std::string encodeHealth(const foundation::HealthCheckResult& health, int64_t uptimeSeconds) {
    json doc = {
        {"status", std::string(foundation::healthStatusName(health.status))},
        {"service", health.serviceName},
        {"uptime_seconds", uptimeSeconds},
    };
    if (!health.components.empty()) {
        json components = json::object();
        for (const auto& [name, status] : health.components) {
            components[name] = std::string(foundation::healthStatusName(status));
        }
        doc["components"] = std::move(components);
    }
    return serialize(doc);
}

std::string encodeNotReady(std::string_view serviceName) {
    json doc = {{"status", "not_ready"}, {"service", std::string(serviceName)}};
    return serialize(doc);
}

}  // namespace eks::service::wire
