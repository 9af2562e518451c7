#include "storage/engine.hpp"

#include "common/logger.hpp"
#include "storage/value_codec.hpp"

#include <map>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>

namespace tierkv {

namespace {

// Remove data files left behind by a previous process.  They only ever
// held evicted copies of in-memory state.
void wipe_data_files(const std::filesystem::path& dir, spdlog::logger& logger) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("cannot create cold-tier directory {}: {}",
                                             dir.string(), ec.message()));
    }

    std::size_t removed = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = e.path().filename().string();
        if (name.rfind("shard-", 0) == 0 && e.path().extension() == ".dat") {
            std::error_code rm_ec;
            if (std::filesystem::remove(e.path(), rm_ec)) ++removed;
        }
    }
    if (removed > 0) {
        logger.info("removed {} stale data files from {}", removed, dir.string());
    }
}

} // anonymous namespace

const char* to_string(PersistenceMode mode) noexcept {
    switch (mode) {
    case PersistenceMode::Disabled: return "disabled";
    case PersistenceMode::Enabled:  return "enabled";
    case PersistenceMode::Degraded: return "degraded";
    }
    return "unknown";
}

std::string format_info(const EngineInfo& info) {
    return fmt::format(
        "shards: {}\n"
        "entries: {}\n"
        "hot_entries: {}\n"
        "cold_entries: {}\n"
        "hot_bytes: {}\n"
        "data_files: {}\n"
        "evictions: {}\n"
        "promotions: {}\n"
        "compactions: {}\n"
        "persistence: {}\n",
        info.num_shards, info.entries, info.hot_entries, info.cold_entries,
        info.hot_bytes, info.data_files, info.evictions, info.promotions,
        info.compactions, to_string(info.persistence));
}

uint64_t hash_key(const std::string& key) noexcept {
    uint64_t h = 0xcbf29ce484222325ull;
    for (unsigned char c : key) {
        h ^= c;
        h *= 0x100000001b3ull;
    }
    return h;
}

Engine::Engine(EngineOptions options)
    : Engine(std::move(options), SteadyClock::instance()) {}

Engine::Engine(EngineOptions options, const Clock& clock)
    : options_(std::move(options)),
      clock_(clock),
      logger_(make_component_logger("engine"))
{
    if (options_.num_shards == 0) {
        throw std::invalid_argument("shard count must be > 0");
    }
    if (options_.shard_memory_bytes > 0) {
        if (options_.cold_dir.empty()) {
            throw std::invalid_argument("a cold-tier directory is required when a shard memory budget is set");
        }
        wipe_data_files(options_.cold_dir, *logger_);
    }

    ShardOptions shard_options;
    shard_options.memory_budget = options_.shard_memory_bytes;
    shard_options.cold_dir = options_.cold_dir;
    shard_options.compaction_threshold = options_.compaction_threshold;

    shards_.reserve(options_.num_shards);
    for (std::size_t i = 0; i < options_.num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(i, clock_, shard_options, logger_));
    }

    logger_->info("engine started: {} shards, {} hot bytes per shard",
                  options_.num_shards,
                  options_.shard_memory_bytes == 0 ? std::string("unlimited")
                                                   : std::to_string(options_.shard_memory_bytes));
}

Engine::~Engine() {
    detach_persistence();
}

std::size_t Engine::shard_index(const std::string& key) const noexcept {
    return static_cast<std::size_t>(hash_key(key) % shards_.size());
}

void Engine::validate_key(const std::string& key) const {
    if (key.empty()) {
        throw EngineError(EngineErrc::EmptyKey, "key must not be empty");
    }
    if (key.size() > kMaxKeyBytes) {
        throw EngineError(EngineErrc::KeyTooLong,
                          fmt::format("key length {} exceeds maximum {}", key.size(), kMaxKeyBytes));
    }
}

void Engine::validate_value(const Value& value) const {
    if (auto err = encoding_error(value)) {
        throw EngineError(EngineErrc::InvalidValue, *err);
    }

    // memory_size() is an upper bound on the encoded size.
    if (value.memory_size() <= options_.max_value_bytes) return;

    std::size_t encoded = encode_value(value).size();
    if (encoded > options_.max_value_bytes) {
        throw EngineError(EngineErrc::ValueTooLarge,
                          fmt::format("value size {} exceeds maximum {}", encoded, options_.max_value_bytes));
    }
}

void Engine::validate_ttl(std::chrono::milliseconds ttl) const {
    if (ttl > kMaxTtl) {
        throw EngineError(EngineErrc::TtlOutOfRange,
                          fmt::format("ttl {}ms exceeds maximum {}ms", ttl.count(), kMaxTtl.count()));
    }
}

void Engine::validate_ttl(const Ttl& ttl) const {
    if (ttl) validate_ttl(*ttl);
}

// ── Single-key operations ────────────────────────────────────────────────────

std::optional<Value> Engine::get(const std::string& key) {
    validate_key(key);
    return shard_for(key).get(key);
}

void Engine::set(const std::string& key, Value value, Ttl ttl) {
    validate_key(key);
    validate_value(value);
    validate_ttl(ttl);
    shard_for(key).set(key, std::move(value), ttl);
}

bool Engine::del(const std::string& key) {
    validate_key(key);
    return shard_for(key).del(key);
}

bool Engine::exists(const std::string& key) {
    validate_key(key);
    return shard_for(key).exists(key);
}

int64_t Engine::incr(const std::string& key, int64_t delta) {
    validate_key(key);
    return shard_for(key).incr(key, delta);
}

int64_t Engine::decr(const std::string& key, int64_t delta) {
    validate_key(key);
    return shard_for(key).decr(key, delta);
}

bool Engine::cas(const std::string& key, const Value& expected, Value desired, Ttl ttl) {
    validate_key(key);
    validate_value(desired);
    validate_ttl(ttl);
    return shard_for(key).cas(key, expected, std::move(desired), ttl);
}

bool Engine::setnx(const std::string& key, Value value, Ttl ttl) {
    validate_key(key);
    validate_value(value);
    validate_ttl(ttl);
    return shard_for(key).setnx(key, std::move(value), ttl);
}

bool Engine::expire(const std::string& key, std::chrono::milliseconds ttl) {
    validate_key(key);
    validate_ttl(ttl);
    return shard_for(key).expire(key, ttl);
}

std::optional<int64_t> Engine::ttl(const std::string& key) {
    validate_key(key);
    return shard_for(key).ttl(key);
}

// ── Batch operations ─────────────────────────────────────────────────────────

std::vector<std::optional<Value>> Engine::mget(const std::vector<std::string>& keys) {
    for (const auto& key : keys) validate_key(key);

    std::vector<std::optional<Value>> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.push_back(shard_for(key).get(key));
    }
    return result;
}

void Engine::mset(std::vector<std::pair<std::string, Value>> pairs, Ttl ttl) {
    for (const auto& [key, value] : pairs) {
        validate_key(key);
        validate_value(value);
    }
    validate_ttl(ttl);

    std::map<std::size_t, std::vector<std::pair<std::string, Value>>> groups;
    for (auto& pair : pairs) {
        groups[shard_index(pair.first)].push_back(std::move(pair));
    }
    for (auto& [index, group] : groups) {
        shards_[index]->mset(std::move(group), ttl);
    }
}

std::size_t Engine::mdel(const std::vector<std::string>& keys) {
    for (const auto& key : keys) validate_key(key);

    std::map<std::size_t, std::vector<std::string>> groups;
    for (const auto& key : keys) {
        groups[shard_index(key)].push_back(key);
    }

    std::size_t removed = 0;
    for (const auto& [index, group] : groups) {
        removed += shards_[index]->mdel(group);
    }
    return removed;
}

std::vector<bool> Engine::mexists(const std::vector<std::string>& keys) {
    for (const auto& key : keys) validate_key(key);

    std::vector<bool> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.push_back(shard_for(key).exists(key));
    }
    return result;
}

// ── Locks ────────────────────────────────────────────────────────────────────

bool Engine::lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) {
    validate_key(key);
    validate_ttl(ttl);
    return shard_for(key).lock(key, owner, ttl);
}

bool Engine::unlock(const std::string& key, const std::string& owner) {
    validate_key(key);
    return shard_for(key).unlock(key, owner);
}

bool Engine::extend_lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) {
    validate_key(key);
    validate_ttl(ttl);
    return shard_for(key).extend_lock(key, owner, ttl);
}

// ── Maintenance ──────────────────────────────────────────────────────────────

std::size_t Engine::sweep_expired() {
    std::size_t removed = 0;
    for (auto& shard : shards_) {
        removed += shard->sweep_expired();
    }
    return removed;
}

std::size_t Engine::compact() {
    std::size_t rewritten = 0;
    for (auto& shard : shards_) {
        rewritten += shard->compact();
    }
    return rewritten;
}

EngineInfo Engine::info() const {
    EngineInfo info;
    info.num_shards = shards_.size();
    for (const auto& shard : shards_) {
        auto s = shard->stats();
        info.hot_entries += s.hot_entries;
        info.cold_entries += s.cold_entries;
        info.hot_bytes += s.hot_bytes;
        info.data_files += s.data_files;
        info.evictions += s.evictions;
        info.promotions += s.promotions;
        info.compactions += s.compactions;
    }
    info.entries = info.hot_entries + info.cold_entries;
    info.persistence = persistence_mode();
    return info;
}

// ── Persistence ──────────────────────────────────────────────────────────────

void Engine::attach_persistence(std::unique_ptr<MutationSink> sink) {
    persistence_ = std::move(sink);
    for (auto& shard : shards_) {
        shard->attach_sink(persistence_.get());
    }
}

void Engine::detach_persistence() {
    if (!persistence_) return;
    for (auto& shard : shards_) {
        shard->attach_sink(nullptr);
    }
    persistence_.reset();
}

PersistenceMode Engine::persistence_mode() const {
    if (!persistence_) return PersistenceMode::Disabled;
    return persistence_->degraded() ? PersistenceMode::Degraded : PersistenceMode::Enabled;
}

void Engine::apply(const MutationOp& op) {
    std::visit(
        [this](const auto& m) {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, MSetOp>) {
                std::map<std::size_t, MSetOp> groups;
                for (const auto& pair : m.pairs) {
                    auto& group = groups[shard_index(pair.first)];
                    group.ttl = m.ttl;
                    group.pairs.push_back(pair);
                }
                for (const auto& [index, group] : groups) {
                    shards_[index]->apply(group);
                }
            } else if constexpr (std::is_same_v<T, MDelOp>) {
                std::map<std::size_t, MDelOp> groups;
                for (const auto& key : m.keys) {
                    groups[shard_index(key)].keys.push_back(key);
                }
                for (const auto& [index, group] : groups) {
                    shards_[index]->apply(group);
                }
            } else {
                shard_for(m.key).apply(m);
            }
        },
        op);
}

void Engine::import_entry(const std::string& key, Entry entry) {
    shard_for(key).import_entry(key, std::move(entry));
}

} // namespace tierkv
