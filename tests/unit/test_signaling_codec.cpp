#include <catch2/catch_test_macros.hpp>
#include "network/signaling_codec.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace tandem;
using namespace tandem::network;

namespace {

const std::string kSdp =
    "v=0\r\n"
    "o=- 4611731400430051336 2 IN IP4 127.0.0.1\r\n"
    "s=-\r\n"
    "t=0 0\r\n"
    "a=group:BUNDLE 0\r\n"
    "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
    "c=IN IP4 0.0.0.0\r\n"
    "a=candidate:1 1 UDP 2122252543 192.168.1.20 50000 typ host\r\n"
    "a=ice-ufrag:abcd\r\n"
    "a=ice-pwd:0123456789abcdef0123456789\r\n"
    "a=fingerprint:sha-256 AA:BB:CC:DD:EE:FF:00:11:22:33:44:55:66:77:88:99\r\n"
    "a=sctp-port:5000\r\n";

std::string encodeRaw(const QByteArray& json) {
    return qCompress(json, 9)
        .toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals)
        .toStdString();
}

} // namespace

TEST_CASE("Descriptor codes decode to the original descriptor", "[signaling]") {
    SECTION("offer") {
        ConnectionDescriptor offer{.kind = DescriptorKind::Offer, .payload = kSdp};
        auto code = encodeDescriptor(offer);
        REQUIRE(code.is_ok());
        auto decoded = decodeDescriptor(code.unwrap());
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == offer);
    }

    SECTION("answer") {
        ConnectionDescriptor answer{.kind = DescriptorKind::Answer, .payload = kSdp};
        auto decoded = encodeDescriptor(answer).and_then(
            [](std::string code) { return decodeDescriptor(code); });
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().kind == DescriptorKind::Answer);
    }
}

TEST_CASE("Descriptor codes are URL-safe and smaller than the SDP", "[signaling]") {
    auto code = encodeDescriptor({.kind = DescriptorKind::Offer, .payload = kSdp}).unwrap();

    REQUIRE(code.size() < kSdp.size());
    for (char c : code) {
        const bool safe = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_';
        REQUIRE(safe);
    }
}

TEST_CASE("Surrounding whitespace in a pasted code is ignored", "[signaling]") {
    ConnectionDescriptor offer{.kind = DescriptorKind::Offer, .payload = kSdp};
    auto code = encodeDescriptor(offer).unwrap();

    auto decoded = decodeDescriptor("  \n" + code + "\r\n ");
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == offer);
}

TEST_CASE("Encoding an empty payload fails", "[signaling]") {
    auto code = encodeDescriptor({.kind = DescriptorKind::Offer, .payload = ""});
    REQUIRE(code.is_err());
    REQUIRE(code.unwrap_err().code == ErrorCode::Signaling);
}

TEST_CASE("Malformed codes fail with a signaling error", "[signaling]") {
    auto code = encodeDescriptor({.kind = DescriptorKind::Offer, .payload = kSdp}).unwrap();

    SECTION("empty") {
        REQUIRE(decodeDescriptor("").unwrap_err().code == ErrorCode::Signaling);
        REQUIRE(decodeDescriptor("   ").unwrap_err().code == ErrorCode::Signaling);
    }

    SECTION("not base64") {
        REQUIRE(decodeDescriptor("not a code!!").unwrap_err().code == ErrorCode::Signaling);
    }

    SECTION("truncated") {
        auto decoded = decodeDescriptor(code.substr(0, code.size() / 2));
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::Signaling);
    }

    SECTION("too short to hold a length prefix") {
        REQUIRE(decodeDescriptor("AAA").unwrap_err().code == ErrorCode::Signaling);
    }

    SECTION("valid compression but not JSON") {
        auto decoded = decodeDescriptor(encodeRaw("hello"));
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::Signaling);
    }

    SECTION("unknown kind") {
        QJsonObject o{{"t", "pranswer"}, {"s", QString::fromStdString(kSdp)}};
        auto decoded = decodeDescriptor(encodeRaw(QJsonDocument(o).toJson(QJsonDocument::Compact)));
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::Signaling);
    }

    SECTION("missing payload") {
        QJsonObject o{{"t", "offer"}};
        auto decoded = decodeDescriptor(encodeRaw(QJsonDocument(o).toJson(QJsonDocument::Compact)));
        REQUIRE(decoded.is_err());
    }
}

TEST_CASE("validateDescriptor requires an SDP version line", "[signaling]") {
    REQUIRE(validateDescriptor({.kind = DescriptorKind::Offer, .payload = kSdp}));
    REQUIRE_FALSE(validateDescriptor({.kind = DescriptorKind::Offer, .payload = ""}));
    REQUIRE_FALSE(validateDescriptor({.kind = DescriptorKind::Answer, .payload = "hello world"}));
}
