#include "network/signaling_codec.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

namespace tandem::network {

namespace {

constexpr auto kBase64Options = QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals;

} // namespace

std::string_view descriptorKindName(DescriptorKind kind) noexcept {
    switch (kind) {
        case DescriptorKind::Offer: return "offer";
        case DescriptorKind::Answer: return "answer";
    }
    return "offer";
}

std::optional<DescriptorKind> descriptorKindFromName(std::string_view name) noexcept {
    if (name == "offer") return DescriptorKind::Offer;
    if (name == "answer") return DescriptorKind::Answer;
    return std::nullopt;
}

Result<std::string> encodeDescriptor(const ConnectionDescriptor& descriptor) {
    if (descriptor.payload.empty()) {
        return fail<std::string>(ErrorCode::Signaling, "Invalid descriptor: empty payload");
    }

    QJsonObject compact;
    compact.insert(QStringLiteral("t"),
                   QString::fromLatin1(descriptorKindName(descriptor.kind).data()));
    compact.insert(QStringLiteral("s"), QString::fromStdString(descriptor.payload));
    const auto json = QJsonDocument(compact).toJson(QJsonDocument::Compact);

    const auto compressed = qCompress(json, 9);
    if (compressed.isEmpty()) {
        return fail<std::string>(ErrorCode::Signaling, "Compression failed: empty result");
    }

    return Result<std::string>::ok(compressed.toBase64(kBase64Options).toStdString());
}

Result<ConnectionDescriptor> decodeDescriptor(std::string_view code) {
    const auto trimmed = QByteArray(code.data(), static_cast<qsizetype>(code.size())).trimmed();
    if (trimmed.isEmpty()) {
        return fail<ConnectionDescriptor>(ErrorCode::Signaling, "Empty code");
    }

    auto decoded = QByteArray::fromBase64Encoding(
        trimmed, kBase64Options | QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return fail<ConnectionDescriptor>(ErrorCode::Signaling,
                                          "Invalid code: not URL-safe base64");
    }

    // qCompress prefixes the uncompressed length; anything shorter is truncated.
    if (decoded.decoded.size() <= 4) {
        return fail<ConnectionDescriptor>(ErrorCode::Signaling, "Invalid code: truncated");
    }
    const auto json = qUncompress(decoded.decoded);
    if (json.isEmpty()) {
        return fail<ConnectionDescriptor>(ErrorCode::Signaling,
                                          "Invalid code: truncated or corrupted");
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail<ConnectionDescriptor>(
            ErrorCode::Signaling,
            "Invalid code: bad JSON (" + parse_error.errorString().toStdString() + ")");
    }

    const auto obj = doc.object();
    const auto kind_value = obj.value(QStringLiteral("t"));
    if (!kind_value.isString()) {
        return fail<ConnectionDescriptor>(ErrorCode::Signaling, "Invalid code: missing kind");
    }
    const auto kind_name = kind_value.toString().toStdString();
    const auto kind = descriptorKindFromName(kind_name);
    if (!kind) {
        return fail<ConnectionDescriptor>(ErrorCode::Signaling,
                                          "Invalid code: unknown kind \"" + kind_name + "\"");
    }

    const auto payload_value = obj.value(QStringLiteral("s"));
    if (!payload_value.isString() || payload_value.toString().isEmpty()) {
        return fail<ConnectionDescriptor>(ErrorCode::Signaling, "Invalid code: missing payload");
    }

    return Result<ConnectionDescriptor>::ok(ConnectionDescriptor{
        .kind = *kind,
        .payload = payload_value.toString().toStdString(),
    });
}

bool validateDescriptor(const ConnectionDescriptor& descriptor) {
    if (descriptor.payload.empty()) {
        return false;
    }
    return descriptor.payload.find("v=0") != std::string::npos;
}

} // namespace tandem::network
