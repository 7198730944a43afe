#include "SnapshotIO.hpp"
#include "CryptoUtils.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace presence {

namespace {

constexpr const char* SNAPSHOT_FORMAT = "presence-embeddings";

nlohmann::json identities_to_json(const std::vector<EnrolledIdentity>& entries) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& entry : entries) {
        list.push_back({
            {"id", entry.id},
            {"name", entry.name},
            {"active", entry.active},
            {"embedding", entry.embedding}
        });
    }
    return list;
}

} // namespace

std::string serialize_snapshot(const EmbeddingSnapshot& snapshot) {
    nlohmann::json identities = identities_to_json(snapshot.entries());

    nlohmann::json doc = {
        {"format", SNAPSHOT_FORMAT},
        {"version", snapshot.version()},
        {"dimension", EMBEDDING_DIM},
        {"checksum", CryptoUtils::sha256(identities.dump())},
        {"identities", identities}
    };
    return doc.dump(2);
}

std::vector<EnrolledIdentity> parse_snapshot(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("snapshot JSON parse error: ") + e.what());
    }

    std::vector<EnrolledIdentity> identities;
    try {
        if (!doc.contains("format") || doc.at("format").get<std::string>() != SNAPSHOT_FORMAT) {
            throw SnapshotError("not a presence embedding snapshot");
        }
        if (doc.at("dimension").get<size_t>() != EMBEDDING_DIM) {
            throw SnapshotError("snapshot dimension " + doc.at("dimension").dump() +
                                " does not match " + std::to_string(EMBEDDING_DIM));
        }

        const nlohmann::json& list = doc.at("identities");
        std::string expected = doc.at("checksum").get<std::string>();
        if (!CryptoUtils::digest_equals(CryptoUtils::sha256(list.dump()), expected)) {
            throw SnapshotError("snapshot checksum mismatch");
        }

        for (const auto& item : list) {
            EnrolledIdentity entry;
            entry.id = item.at("id").get<std::string>();
            entry.name = item.value("name", std::string());
            entry.active = item.value("active", true);
            entry.embedding = item.at("embedding").get<Embedding>();
            identities.push_back(std::move(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("malformed snapshot: ") + e.what());
    }

    std::unordered_set<std::string> seen;
    for (const auto& entry : identities) {
        if (entry.id.empty() || !seen.insert(entry.id).second) {
            throw SnapshotError("snapshot has an empty or duplicate identity id: '" + entry.id + "'");
        }
        try {
            EmbeddingStore::validate_embedding(entry.embedding);
        } catch (const InvalidEmbedding& e) {
            throw SnapshotError("identity " + entry.id + ": " + e.what());
        }
    }
    return identities;
}

void save_snapshot(const EmbeddingSnapshot& snapshot, const std::string& path) {
    std::ofstream out_file(path, std::ios::trunc);
    if (!out_file.is_open()) {
        throw SnapshotError("cannot write snapshot file: " + path);
    }
    out_file << serialize_snapshot(snapshot);
    out_file.close();
    if (!out_file) {
        throw SnapshotError("failed writing snapshot file: " + path);
    }
    std::cout << "[Snapshot] Saved " << snapshot.size() << " identities to " << path << std::endl;
}

std::vector<EnrolledIdentity> load_snapshot(const std::string& path) {
    std::ifstream in_file(path);
    if (!in_file.is_open()) {
        throw SnapshotError("cannot open snapshot file: " + path);
    }
    std::stringstream buffer;
    buffer << in_file.rdbuf();

    auto identities = parse_snapshot(buffer.str());
    std::cout << "[Snapshot] Loaded " << identities.size() << " identities from " << path << std::endl;
    return identities;
}

} // namespace presence
