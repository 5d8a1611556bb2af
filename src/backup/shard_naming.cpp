#include "backup/shard_naming.hpp"
#include <cinttypes>
#include <cstdio>
#include <regex>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string escapeRegex(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

bool parseNumber(const std::string& digits, uint64_t& value) {
    try {
        size_t used = 0;
        value = std::stoull(digits, &used, 10);
        return used == digits.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string formatShardName(const std::string& prefix, uint64_t index, uint64_t byteOffset,
                            const std::string& extension) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "-s%03" PRIu64 "-b%010" PRIu64 ".", index, byteOffset);
    return prefix + buffer + extension;
}

std::string formatMetadataName(const std::string& prefix, uint64_t index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "-m%03" PRIu64 ".json", index);
    return prefix + buffer;
}

NameMatch parseObjectName(const std::string& prefix, const std::string& name, ParsedName& parsed) {
    const std::string escaped = escapeRegex(prefix);
    const std::regex shardPattern("^" + escaped + R"(-s(\d{3,})-b(\d{10,})\.(.+)$)");
    const std::regex metadataPattern("^" + escaped + R"(-m(\d{3,})\.json$)");
    const std::regex claimedPattern("^" + escaped + R"(-s\d)");

    std::smatch match;
    if (std::regex_match(name, match, shardPattern)) {
        if (!parseNumber(match[1].str(), parsed.index) || !parseNumber(match[2].str(), parsed.byteOffset) ||
            parsed.index == 0) {
            return NameMatch::Malformed;
        }
        parsed.extension = match[3].str();
        return NameMatch::Shard;
    }
    if (std::regex_match(name, match, metadataPattern)) {
        if (!parseNumber(match[1].str(), parsed.index) || parsed.index == 0) {
            return NameMatch::Unrelated;
        }
        return NameMatch::Metadata;
    }
    if (std::regex_search(name, claimedPattern)) {
        return NameMatch::Malformed;
    }
    return NameMatch::Unrelated;
}

std::string shardNamePrefix(const std::string& name) {
    static const std::regex anyShard(R"(^(.+)-s\d{3,}-b\d{10,}\.[^-]+$)");
    std::smatch match;
    if (std::regex_match(name, match, anyShard)) {
        return match[1].str();
    }
    return "";
}

std::string ShardMetadata::toJson() const {
    json document = {
        {"index", index},
        {"byteOffset", byteOffset},
        {"plaintextSize", plaintextSize},
        {"isFinal", isFinal},
        {"shardSizeTarget", shardSizeTarget},
        {"ciphertextSize", ciphertextSize},
        {"extension", extension},
        {"sourceIdentifier", sourceIdentifier},
        {"sinceIdentifier", sinceIdentifier}
    };
    return document.dump(2);
}

ShardMetadata ShardMetadata::fromJson(const std::string& text) {
    ShardMetadata metadata;
    try {
        json document = json::parse(text);
        metadata.index = document.at("index").get<uint64_t>();
        metadata.byteOffset = document.at("byteOffset").get<uint64_t>();
        metadata.plaintextSize = document.at("plaintextSize").get<uint64_t>();
        metadata.isFinal = document.at("isFinal").get<bool>();
        metadata.shardSizeTarget = document.value("shardSizeTarget", static_cast<uint64_t>(0));
        metadata.ciphertextSize = document.value("ciphertextSize", static_cast<uint64_t>(0));
        metadata.extension = document.value("extension", std::string());
        metadata.sourceIdentifier = document.value("sourceIdentifier", std::string());
        metadata.sinceIdentifier = document.value("sinceIdentifier", std::string());
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed shard metadata: ") + e.what());
    }
    return metadata;
}
