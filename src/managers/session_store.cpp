#include "session_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

SessionStore::SessionStore(const fs::path& state_dir)
    : record_path_(state_dir / SESSION_FILE_NAME) {
}

bool SessionStore::exists() const {
    std::error_code ec;
    return fs::exists(record_path_, ec);
}

Result<SessionRecord> SessionStore::load() const {
    if (!exists()) {
        return Result<SessionRecord>::Err(ErrorCode::NoActiveSession, "No active session.");
    }

    auto corrupt = [this](const std::string& why) {
        ego_logf("session record {} unreadable: {}", record_path_.string(), why);
        return Result<SessionRecord>::Err(ErrorCode::CorruptRecord,
            fmt::format("Session record at {} is unreadable ({}).", record_path_.string(), why));
    };

    try {
        const YAML::Node root = YAML::LoadFile(record_path_.string());
        if (!root.IsMap()) {
            return corrupt("not a mapping");
        }

        int version = root["version"].as<int>(0);
        if (version != SESSION_RECORD_VERSION) {
            return corrupt(fmt::format("unsupported version {}", version));
        }

        SessionRecord record;
        record.project_path = root["project_path"].as<std::string>();
        if (record.project_path.empty()) {
            return corrupt("empty project_path");
        }

        auto start = root["start_time"].as<std::string>();
        if (!parse_iso_utc(start, record.start_time)) {
            return corrupt("bad start_time '" + start + "'");
        }

        record.initial_line_count = root["initial_line_count"].as<uint64_t>();
        record.initial_char_count = root["initial_char_count"].as<uint64_t>(0);

        if (root["initial_files"] && root["initial_files"].IsSequence()) {
            for (const auto& n : root["initial_files"]) {
                FileFingerprint f;
                f.path = n["path"].as<std::string>();
                f.size = n["size"].as<uint64_t>(0);
                if (!hex_to_hash(n["hash"].as<std::string>(""), f.hash)) {
                    return corrupt("bad hash for " + f.path);
                }
                record.initial_files.push_back(f);
            }
        }

        return Result<SessionRecord>::Ok(std::move(record));
    } catch (const std::exception& e) {
        return corrupt(e.what());
    }
}

Result<void> SessionStore::save(const SessionRecord& record) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << SESSION_RECORD_VERSION;
    out << YAML::Key << "project_path" << YAML::Value << record.project_path;
    out << YAML::Key << "start_time" << YAML::Value << to_iso_utc(record.start_time);
    out << YAML::Key << "initial_line_count" << YAML::Value << record.initial_line_count;
    out << YAML::Key << "initial_char_count" << YAML::Value << record.initial_char_count;

    out << YAML::Key << "initial_files" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : record.initial_files) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << f.path;
        out << YAML::Key << "size" << YAML::Value << f.size;
        out << YAML::Key << "hash" << YAML::Value << hash_to_hex(f.hash);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    if (!out.good()) {
        return Result<void>::Err("Failed to encode session record: " + out.GetLastError());
    }

    std::string error;
    if (!platform::write_file_atomic(record_path_, std::string(out.c_str(), out.size()), error)) {
        return Result<void>::Err("Failed to save session record: " + error);
    }
    return Result<void>::Ok();
}

Result<void> SessionStore::remove() {
    std::error_code ec;
    bool removed = fs::remove(record_path_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Failed to remove {}: {}",
                                             record_path_.string(), ec.message()));
    }
    if (!removed) {
        return Result<void>::Err(ErrorCode::NoActiveSession, "No active session.");
    }
    return Result<void>::Ok();
}
