#pragma once

#include "util/SingleFlight.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <json/json.h>

namespace minstrel::backend {

// Named parameters of a cached call. std::map keeps them sorted by name,
// which is what makes the signature independent of argument order.
using NamedParams = std::map<std::string, std::string>;

inline constexpr size_t SIGNATURE_SLUG_LENGTH = 120;
inline constexpr size_t SIGNATURE_DIGEST_LENGTH = 16;

/**
 * Deterministic identity of a remote call: operation name plus its named
 * parameters. Anything a call depends on that is not a named parameter
 * (a captured argument, the token) is deliberately not part of the key.
 */
class CallSignature {
public:
    CallSignature(std::string operation, NamedParams params);

    const std::string& operation() const { return operation_; }
    const NamedParams& params() const { return params_; }

    // Canonical text: <operation> [("k", "v"), ("k2", "v2")]
    const std::string& text() const { return text_; }

    // <slug of text, max 120 bytes>--<16 hex of sha256(text)>.json
    std::string filename() const;

    bool operator==(const CallSignature& other) const { return text_ == other.text_; }

private:
    std::string operation_;
    NamedParams params_;
    std::string text_;
};

/**
 * Permanent on-disk memoization keyed by CallSignature.
 *
 * One JSON file per signature under root(). Entries never expire and are
 * never evicted; clear() is the only way to drop them. Concurrent callers
 * for the same signature share one computation. An entry that cannot be
 * decoded is treated as a miss and overwritten.
 */
class CacheStore {
public:
    using Compute = std::function<Json::Value()>;

    // memoize=false wipes root and starts disabled
    explicit CacheStore(std::filesystem::path root, bool memoize = true);

    Json::Value get_or_compute(const CallSignature& signature, const Compute& compute);

    // Remove the whole cache directory and stop reading/writing for this session
    void clear();

    [[nodiscard]] bool enabled() const { return enabled_; }
    [[nodiscard]] bool contains(const CallSignature& signature) const;
    [[nodiscard]] size_t entry_count() const;
    std::filesystem::path entry_path(const CallSignature& signature) const;
    const std::filesystem::path& root() const { return root_; }

    static bool is_entry_filename(const std::string& name);

private:
    std::optional<Json::Value> read_entry(const CallSignature& signature) const;
    bool write_entry(const CallSignature& signature, const Json::Value& value) const;

    std::filesystem::path root_;
    std::atomic<bool> enabled_{true};
    util::SingleFlight<std::string, Json::Value> flights_;
};

}  // namespace minstrel::backend
