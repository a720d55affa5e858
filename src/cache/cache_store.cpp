#include "cache_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

fs::path CacheStore::record_path(const fs::path& key) {
    return key / CACHE_RECORD_FILE;
}

std::optional<CacheRecord> CacheStore::load(const fs::path& key) const {
    fs::path path = record_path(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        if (!root.IsMap() || root["format"].as<int>(0) != CACHE_RECORD_FORMAT) {
            gen_log(fmt::format("CacheReadError: {} has an unknown format, treating as miss",
                                path.string()));
            return std::nullopt;
        }

        CacheRecord record;
        record.key = root["key"].as<std::string>("");
        record.fingerprint.hex = root["fingerprint"].as<std::string>("");
        record.committed_at = root["committed_at"].as<std::string>("");

        if (root["inputs"] && root["inputs"].IsSequence()) {
            for (const auto& n : root["inputs"]) {
                record.inputs.push_back(n.as<std::string>());
            }
        }
        if (root["outputs"] && root["outputs"].IsSequence()) {
            for (const auto& n : root["outputs"]) {
                record.outputs.push_back(n.as<std::string>());
            }
        }

        if (record.fingerprint.hex.empty()) {
            gen_log(fmt::format("CacheReadError: {} has no fingerprint, treating as miss",
                                path.string()));
            return std::nullopt;
        }
        return record;

    } catch (const std::exception& e) {
        // Corrupted record: start fresh
        gen_log(fmt::format("CacheReadError: {}: {}", path.string(), e.what()));
        return std::nullopt;
    }
}

std::optional<Fingerprint> CacheStore::lookup(const fs::path& key) const {
    auto record = load(key);
    if (!record) return std::nullopt;
    return record->fingerprint;
}

bool CacheStore::is_stale(const std::optional<Fingerprint>& previous,
                          const Fingerprint& current) {
    return !previous || *previous != current;
}

bool CacheStore::is_stale(const fs::path& key, const Fingerprint& current) const {
    return is_stale(lookup(key), current);
}

Result<void, GenError> CacheStore::commit(const fs::path& key,
                                          const Fingerprint& fp,
                                          const TrackedInputSet& inputs,
                                          const std::vector<fs::path>& outputs) const {
    using R = Result<void, GenError>;
    fs::path path = record_path(key);

    std::error_code ec;
    fs::create_directories(key, ec);
    if (ec) {
        return R::Err(GenError::commit(path, ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "format" << YAML::Value << CACHE_RECORD_FORMAT;
    out << YAML::Key << "key" << YAML::Value << key.string();
    out << YAML::Key << "fingerprint" << YAML::Value << fp.hex;
    out << YAML::Key << "committed_at" << YAML::Value << now_iso();

    out << YAML::Key << "inputs" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : inputs.paths()) {
        out << p.string();
    }
    out << YAML::EndSeq;

    out << YAML::Key << "outputs" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : outputs) {
        out << p.string();
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    // Readers only ever see the old record or the complete new one.
    fs::path tmp = path;
    tmp += fmt::format(".tmp.{}", platform::current_pid());
    {
        std::ofstream fout(tmp, std::ios::binary | std::ios::trunc);
        if (!fout) {
            return R::Err(GenError::commit(path, "cannot open " + tmp.string()));
        }
        fout << out.c_str() << "\n";
        fout.flush();
        if (!fout) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return R::Err(GenError::commit(path, "write to " + tmp.string() + " failed"));
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return R::Err(GenError::commit(path, ec.message()));
    }

    gen_log(fmt::format("Committed {} -> {}", key.string(), fp.hex));
    return R::Ok();
}
