#include "backend/CacheStore.hpp"
#include "backend/Errors.hpp"
#include "util/Digest.hpp"
#include "util/JsonUtils.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <cctype>

namespace minstrel::backend {

namespace {

std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// Throws CacheCorruption for anything that is not a blob written for this signature
Json::Value decode_blob(const std::string& blob, const CallSignature& signature) {
    std::string errors;
    auto root = util::parse_json(blob, &errors);
    if (!root) {
        throw CacheCorruption("unparsable cache entry: " + errors);
    }
    if (!root->isObject() || !(*root)["signature"].isString() || !root->isMember("value")) {
        throw CacheCorruption("cache entry is missing its envelope");
    }
    if ((*root)["signature"].asString() != signature.text()) {
        throw CacheCorruption("cache entry belongs to another signature: " + (*root)["signature"].asString());
    }
    return (*root)["value"];
}

}  // namespace

CallSignature::CallSignature(std::string operation, NamedParams params)
    : operation_(std::move(operation)), params_(std::move(params)) {
    text_ = operation_ + " [";
    bool first = true;
    for (const auto& [key, value] : params_) {
        if (!first) text_ += ", ";
        text_ += "(" + quoted(key) + ", " + quoted(value) + ")";
        first = false;
    }
    text_ += "]";
}

std::string CallSignature::filename() const {
    std::string slug = util::slugify(text_, SIGNATURE_SLUG_LENGTH);
    std::string digest = util::Digest::sha256_hex(text_).substr(0, SIGNATURE_DIGEST_LENGTH);
    return slug + "--" + digest + ".json";
}

CacheStore::CacheStore(std::filesystem::path root, bool memoize) : root_(std::move(root)) {
    if (!memoize) {
        clear();
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        util::Logger::error("CacheStore: Cannot create cache root " + root_.string() + ": " + ec.message());
    } else {
        util::Logger::info("CacheStore: Cache root set to " + root_.string());
    }
}

Json::Value CacheStore::get_or_compute(const CallSignature& signature, const Compute& compute) {
    if (!enabled_) {
        return compute();
    }

    return flights_.run(signature.text(), [&]() -> Json::Value {
        if (auto cached = read_entry(signature)) {
            util::Logger::info("CacheStore: Retrieved " + signature.filename() + " from cache");
            return *cached;
        }

        Json::Value value = compute();
        if (enabled_ && write_entry(signature, value)) {
            util::Logger::info("CacheStore: Cached new " + signature.filename() + " from api");
        }
        return value;
    });
}

std::optional<Json::Value> CacheStore::read_entry(const CallSignature& signature) const {
    auto path = entry_path(signature);
    util::Logger::debug("CacheStore: Cache name resolved as " + path.string());

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    auto blob = util::Platform::read_file(path);
    if (!blob) {
        util::Logger::warn("CacheStore: Unreadable entry " + path.filename().string() + ", recomputing");
        return std::nullopt;
    }

    try {
        return decode_blob(*blob, signature);
    } catch (const CacheCorruption& e) {
        util::Logger::warn("CacheStore: Corrupt entry " + path.filename().string() + " (" + e.what() +
                           "), recomputing");
        return std::nullopt;
    }
}

bool CacheStore::write_entry(const CallSignature& signature, const Json::Value& value) const {
    Json::Value envelope(Json::objectValue);
    envelope["signature"] = signature.text();
    envelope["value"] = value;

    std::string error;
    if (!util::Platform::write_file_atomic(entry_path(signature), util::write_json(envelope), &error)) {
        util::Logger::error("CacheStore: Failed to write entry: " + error);
        return false;
    }
    return true;
}

void CacheStore::clear() {
    enabled_ = false;

    std::error_code ec;
    auto removed = std::filesystem::remove_all(root_, ec);
    if (ec) {
        util::Logger::error("CacheStore: Failed to clear " + root_.string() + ": " + ec.message());
        return;
    }
    util::Logger::info("CacheStore: Cleared " + std::to_string(removed) + " files, memoization disabled");
}

bool CacheStore::contains(const CallSignature& signature) const {
    std::error_code ec;
    return std::filesystem::exists(entry_path(signature), ec);
}

size_t CacheStore::entry_count() const {
    size_t count = 0;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return 0;
    }
    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        if (entry.is_regular_file() && is_entry_filename(entry.path().filename().string())) {
            count++;
        }
    }
    return count;
}

std::filesystem::path CacheStore::entry_path(const CallSignature& signature) const {
    return root_ / signature.filename();
}

bool CacheStore::is_entry_filename(const std::string& name) {
    // <slug>--<SIGNATURE_DIGEST_LENGTH hex>.json
    const std::string suffix = ".json";
    if (name.size() < SIGNATURE_DIGEST_LENGTH + 2 + suffix.size()) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    size_t digest_start = name.size() - suffix.size() - SIGNATURE_DIGEST_LENGTH;
    if (name.compare(digest_start - 2, 2, "--") != 0) return false;
    for (size_t i = digest_start; i < digest_start + SIGNATURE_DIGEST_LENGTH; ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(name[i]))) return false;
    }
    return true;
}

}  // namespace minstrel::backend
