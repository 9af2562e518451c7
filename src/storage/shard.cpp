#include "storage/shard.hpp"

#include "storage/engine_error.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

#include <fmt/format.h>

namespace tierkv {

namespace {

// Per-entry bookkeeping charged on top of key + value: the hash node, the
// HotEntry itself and its ring slot.
constexpr std::size_t kEntryOverhead = 96;

int64_t saturating_add(int64_t a, int64_t b) {
    int64_t r = 0;
    if (__builtin_add_overflow(a, b, &r)) {
        return b > 0 ? std::numeric_limits<int64_t>::max()
                     : std::numeric_limits<int64_t>::min();
    }
    return r;
}

int64_t saturating_sub(int64_t a, int64_t b) {
    int64_t r = 0;
    if (__builtin_sub_overflow(a, b, &r)) {
        return b < 0 ? std::numeric_limits<int64_t>::max()
                     : std::numeric_limits<int64_t>::min();
    }
    return r;
}

Value make_lock_record(const std::string& owner, int64_t acquired_at_ms) {
    Value::Map m;
    m.emplace("owner", Value{owner});
    m.emplace("acquired_at", Value{acquired_at_ms});
    return Value{std::move(m)};
}

bool lock_owned_by(const Value& v, const std::string& owner) {
    const auto* m = std::get_if<Value::Map>(&v.data);
    if (m == nullptr) return false;
    auto it = m->find("owner");
    return it != m->end() && it->second.is_string() && it->second.as_string() == owner;
}

} // anonymous namespace

Shard::Shard(std::size_t id,
             const Clock& clock,
             ShardOptions options,
             std::shared_ptr<spdlog::logger> logger)
    : id_(id),
      clock_(clock),
      options_(std::move(options)),
      logger_(std::move(logger)) {}

// ── Helpers ──────────────────────────────────────────────────────────────────

std::size_t Shard::charge_of(const std::string& key, const Entry& entry) const noexcept {
    return kEntryOverhead + key.size() + entry.value.memory_size();
}

// Clamped to [0, kMaxTtl] so replayed or directly applied records cannot
// overflow the clock.  A non-positive TTL expires the entry immediately.
Clock::time_point Shard::deadline(std::chrono::milliseconds ttl) const {
    return clock_.now() + std::clamp(ttl, std::chrono::milliseconds{0}, kMaxTtl);
}

std::optional<Clock::time_point> Shard::deadline(const Ttl& ttl) const {
    if (!ttl) return std::nullopt;
    return deadline(*ttl);
}

void Shard::record(MutationOp op) {
    if (sink_ == nullptr) return;
    last_lsn_ = sink_->record(id_, std::move(op));
}

uint64_t Shard::next_version_locked(const std::string& key) const {
    auto now = clock_.now();
    if (auto it = hot_.find(key); it != hot_.end()) {
        return it->second.entry.is_expired(now) ? 1 : it->second.entry.version + 1;
    }
    if (auto it = cold_.find(key); it != cold_.end()) {
        const auto& loc = it->second;
        bool expired = loc.expires_at && *loc.expires_at <= now;
        return expired ? 1 : loc.version + 1;
    }
    return 1;
}

bool Shard::is_live_locked(const std::string& key) const {
    auto now = clock_.now();
    if (auto it = hot_.find(key); it != hot_.end()) {
        return !it->second.entry.is_expired(now);
    }
    if (auto it = cold_.find(key); it != cold_.end()) {
        return !(it->second.expires_at && *it->second.expires_at <= now);
    }
    return false;
}

std::error_code Shard::read_cold(const ColdLocation& loc, Entry& out) const {
    auto fit = files_.find(loc.file_id);
    if (fit == files_.end()) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    std::vector<uint8_t> bytes;
    if (auto ec = fit->second->read(loc.offset, loc.length, bytes)) {
        return ec;
    }

    DecodedEntry decoded;
    const uint8_t* ptr = bytes.data();
    const uint8_t* end = bytes.data() + bytes.size();
    if (!decode_entry(ptr, end, decoded) || ptr != end) {
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }

    out.value = std::move(decoded.value);
    out.version = decoded.version;
    out.expires_at.reset();
    if (decoded.expires_at) {
        out.expires_at = from_ticks(*decoded.expires_at);
    }
    return {};
}

void Shard::drop_cold_locked(const std::string& key, const ColdLocation& loc) {
    if (auto fit = files_.find(loc.file_id); fit != files_.end()) {
        fit->second->add_dead(loc.length);
    }
    cold_.erase(key);
}

std::error_code Shard::ensure_active_file_locked() {
    if (active_) return {};

    uint32_t fid = next_file_id_.fetch_add(1);
    auto path = options_.cold_dir / fmt::format("shard-{}-{}.dat", id_, fid);

    std::error_code ec;
    auto file = DataFile::create(path, fid, ec);
    if (ec) return ec;

    files_.emplace(fid, file);
    active_ = std::move(file);
    return {};
}

void Shard::compact_ring_locked() {
    if (ring_.size() <= 2 * hot_.size() + 64) return;

    std::deque<std::pair<std::string, uint64_t>> kept;
    for (auto& slot : ring_) {
        auto it = hot_.find(slot.first);
        if (it != hot_.end() && it->second.seq == slot.second) {
            kept.push_back(std::move(slot));
        }
    }
    ring_.swap(kept);
}

// ── Tier transitions ─────────────────────────────────────────────────────────

std::optional<Entry> Shard::load_locked(const std::string& key) {
    auto now = clock_.now();

    if (auto it = hot_.find(key); it != hot_.end()) {
        if (it->second.entry.is_expired(now)) {
            erase_locked(key);
            return std::nullopt;
        }
        it->second.referenced.store(true, std::memory_order_relaxed);
        return it->second.entry;
    }

    auto cit = cold_.find(key);
    if (cit == cold_.end()) return std::nullopt;

    ColdLocation loc = cit->second;
    if (loc.expires_at && *loc.expires_at <= now) {
        drop_cold_locked(key, loc);
        return std::nullopt;
    }

    Entry entry;
    if (auto ec = read_cold(loc, entry)) {
        logger_->error("shard {}: unreadable cold record for '{}' (file {}, offset {}): {}; dropping",
                       id_, key, loc.file_id, loc.offset, ec.message());
        drop_cold_locked(key, loc);
        return std::nullopt;
    }

    // An entry larger than the whole budget is served straight from disk.
    if (charge_of(key, entry) > options_.memory_budget) {
        return entry;
    }

    promotions_.fetch_add(1, std::memory_order_relaxed);
    put_locked(key, entry, /*protect=*/true);
    return entry;
}

void Shard::put_locked(const std::string& key, Entry entry, bool protect) {
    if (auto cit = cold_.find(key); cit != cold_.end()) {
        ColdLocation loc = cit->second;
        drop_cold_locked(key, loc);
    }

    std::size_t charge = charge_of(key, entry);
    auto [it, inserted] = hot_.try_emplace(key);
    HotEntry& slot = it->second;
    if (!inserted) {
        hot_bytes_ -= slot.charge;
    }
    slot.entry = std::move(entry);
    slot.charge = charge;
    slot.referenced.store(true, std::memory_order_relaxed);
    if (inserted) {
        slot.seq = ++next_seq_;
        ring_.emplace_back(key, slot.seq);
    }
    hot_bytes_ += charge;

    if (has_budget()) {
        evict_locked(protect ? &key : nullptr);
    }
}

bool Shard::erase_locked(const std::string& key) {
    if (auto it = hot_.find(key); it != hot_.end()) {
        hot_bytes_ -= it->second.charge;
        hot_.erase(it);
        compact_ring_locked();
        return true;
    }
    if (auto cit = cold_.find(key); cit != cold_.end()) {
        ColdLocation loc = cit->second;
        drop_cold_locked(key, loc);
        return true;
    }
    return false;
}

void Shard::evict_locked(const std::string* keep) {
    // Two sweeps of the hand clear every reference bit, so this bounds the
    // number of second chances handed out.
    std::size_t chances = 2 * ring_.size() + 2;

    while (hot_bytes_ > options_.memory_budget && !ring_.empty()) {
        auto [key, seq] = std::move(ring_.front());
        ring_.pop_front();

        auto it = hot_.find(key);
        if (it == hot_.end() || it->second.seq != seq) {
            continue;  // stale slot
        }

        bool spared = (keep != nullptr && key == *keep) ||
                      it->second.referenced.exchange(false, std::memory_order_relaxed);
        if (spared) {
            ring_.emplace_back(std::move(key), seq);
            if (chances-- == 0) break;
            continue;
        }

        if (!evict_one_locked(key)) {
            ring_.emplace_back(std::move(key), seq);
            break;
        }
    }

    compact_ring_locked();
}

bool Shard::evict_one_locked(const std::string& key) {
    auto it = hot_.find(key);
    if (it == hot_.end()) return false;

    if (auto ec = ensure_active_file_locked()) {
        logger_->error("shard {}: cannot open data file in {}: {}",
                       id_, options_.cold_dir.string(), ec.message());
        return false;
    }

    const Entry& entry = it->second.entry;
    std::optional<int64_t> expires;
    if (entry.expires_at) {
        expires = to_ticks(*entry.expires_at);
    }

    std::vector<uint8_t> bytes;
    encode_entry(bytes, entry.value, expires, entry.version);

    uint64_t offset = 0;
    uint32_t length = 0;
    if (auto ec = active_->append(bytes, offset, length)) {
        logger_->error("shard {}: eviction write to {} failed: {}",
                       id_, active_->path().string(), ec.message());
        return false;
    }

    cold_[key] = ColdLocation{active_->id(), offset, length, entry.version, entry.expires_at};
    hot_bytes_ -= it->second.charge;
    hot_.erase(it);
    evictions_.fetch_add(1, std::memory_order_relaxed);

    if (active_->size() >= options_.max_data_file_bytes) {
        active_.reset();
    }
    return true;
}

// ── Reads ────────────────────────────────────────────────────────────────────

std::optional<Value> Shard::get(const std::string& key) {
    {
        std::shared_lock lock(mutex_);
        auto now = clock_.now();
        if (auto it = hot_.find(key); it != hot_.end()) {
            if (it->second.entry.is_expired(now)) return std::nullopt;
            it->second.referenced.store(true, std::memory_order_relaxed);
            return it->second.entry.value;
        }
        auto cit = cold_.find(key);
        if (cit == cold_.end()) return std::nullopt;
        if (cit->second.expires_at && *cit->second.expires_at <= now) return std::nullopt;
    }

    // Cold hit: promotion changes tier placement.
    std::unique_lock lock(mutex_);
    auto entry = load_locked(key);
    if (!entry) return std::nullopt;
    return std::move(entry->value);
}

bool Shard::exists(const std::string& key) {
    {
        std::shared_lock lock(mutex_);
        auto now = clock_.now();
        if (auto it = hot_.find(key); it != hot_.end()) {
            if (it->second.entry.is_expired(now)) return false;
            it->second.referenced.store(true, std::memory_order_relaxed);
            return true;
        }
        if (cold_.find(key) == cold_.end()) return false;
    }

    std::unique_lock lock(mutex_);
    return load_locked(key).has_value();
}

std::optional<int64_t> Shard::ttl(const std::string& key) {
    std::unique_lock lock(mutex_);
    auto entry = load_locked(key);
    if (!entry) return std::nullopt;
    if (!entry->expires_at) return -1;

    auto left = std::chrono::ceil<std::chrono::milliseconds>(*entry->expires_at - clock_.now());
    return left.count();
}

// ── Writes ───────────────────────────────────────────────────────────────────

void Shard::set_locked(const std::string& key, Value value, const Ttl& ttl) {
    Entry entry{std::move(value), deadline(ttl), next_version_locked(key)};
    put_locked(key, std::move(entry), false);
}

void Shard::set(const std::string& key, Value value, Ttl ttl) {
    std::unique_lock lock(mutex_);
    if (sink_ != nullptr) {
        record(SetOp{key, value, ttl});
    }
    set_locked(key, std::move(value), ttl);
}

bool Shard::del(const std::string& key) {
    std::unique_lock lock(mutex_);
    bool live = is_live_locked(key);
    erase_locked(key);
    if (live) {
        record(DeleteOp{key});
    }
    return live;
}

int64_t Shard::add_locked(const std::string& key, int64_t delta, bool subtract) {
    auto current = load_locked(key);

    int64_t base = 0;
    std::optional<Clock::time_point> expires;
    uint64_t version = 1;
    if (current) {
        if (!current->value.is_int()) {
            throw EngineError(EngineErrc::TypeMismatch,
                              fmt::format("value at '{}' is {}, not Int", key, current->value.type_name()));
        }
        base = current->value.as_int();
        expires = current->expires_at;
        version = current->version + 1;
    }

    int64_t result = subtract ? saturating_sub(base, delta) : saturating_add(base, delta);
    put_locked(key, Entry{Value{result}, expires, version}, false);
    return result;
}

int64_t Shard::incr(const std::string& key, int64_t delta) {
    std::unique_lock lock(mutex_);
    int64_t result = add_locked(key, delta, false);
    record(IncrOp{key, delta});
    return result;
}

int64_t Shard::decr(const std::string& key, int64_t delta) {
    std::unique_lock lock(mutex_);
    int64_t result = add_locked(key, delta, true);
    record(DecrOp{key, delta});
    return result;
}

bool Shard::cas(const std::string& key, const Value& expected, Value desired, Ttl ttl) {
    std::unique_lock lock(mutex_);
    auto current = load_locked(key);
    if (!current || !(current->value == expected)) {
        return false;
    }

    if (sink_ != nullptr) {
        record(SetOp{key, desired, ttl});
    }
    put_locked(key, Entry{std::move(desired), deadline(ttl), current->version + 1}, false);
    return true;
}

bool Shard::setnx_locked(const std::string& key, Value value, const Ttl& ttl) {
    if (load_locked(key)) return false;
    set_locked(key, std::move(value), ttl);
    return true;
}

bool Shard::setnx(const std::string& key, Value value, Ttl ttl) {
    std::unique_lock lock(mutex_);
    if (sink_ == nullptr) {
        return setnx_locked(key, std::move(value), ttl);
    }
    Value logged = value;
    if (!setnx_locked(key, std::move(value), ttl)) return false;
    record(SetNxOp{key, std::move(logged), ttl});
    return true;
}

bool Shard::expire(const std::string& key, std::chrono::milliseconds ttl) {
    std::unique_lock lock(mutex_);
    auto current = load_locked(key);
    if (!current) return false;

    if (sink_ != nullptr) {
        record(SetOp{key, current->value, ttl});
    }
    current->expires_at = deadline(ttl);
    current->version += 1;
    put_locked(key, std::move(*current), false);
    return true;
}

void Shard::mset(std::vector<std::pair<std::string, Value>> pairs, Ttl ttl) {
    if (pairs.empty()) return;

    std::unique_lock lock(mutex_);
    for (const auto& [key, value] : pairs) {
        set_locked(key, value, ttl);
    }
    record(MSetOp{std::move(pairs), ttl});
}

std::size_t Shard::mdel_locked(const std::vector<std::string>& keys,
                               std::vector<std::string>* removed) {
    std::size_t count = 0;
    for (const auto& key : keys) {
        bool live = is_live_locked(key);
        erase_locked(key);
        if (live) {
            ++count;
            if (removed != nullptr) removed->push_back(key);
        }
    }
    return count;
}

std::size_t Shard::mdel(const std::vector<std::string>& keys) {
    std::unique_lock lock(mutex_);
    std::vector<std::string> removed;
    std::size_t count = mdel_locked(keys, &removed);
    if (count > 0) {
        record(MDelOp{std::move(removed)});
    }
    return count;
}

bool Shard::lock_locked(const std::string& key,
                        const std::string& owner,
                        std::chrono::milliseconds ttl,
                        int64_t acquired_at_ms) {
    if (load_locked(key)) return false;
    Entry entry{make_lock_record(owner, acquired_at_ms), deadline(ttl), next_version_locked(key)};
    put_locked(key, std::move(entry), false);
    return true;
}

bool Shard::lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) {
    std::unique_lock lock(mutex_);
    int64_t acquired = unix_now_ms();
    if (!lock_locked(key, owner, ttl, acquired)) return false;
    record(LockOp{key, owner, ttl, acquired});
    return true;
}

bool Shard::unlock_locked(const std::string& key, const std::string& owner) {
    auto current = load_locked(key);
    if (!current) return false;
    if (!lock_owned_by(current->value, owner)) {
        throw EngineError(EngineErrc::LockOwnerMismatch,
                          fmt::format("lock '{}' is not held by '{}'", key, owner));
    }
    erase_locked(key);
    return true;
}

bool Shard::unlock(const std::string& key, const std::string& owner) {
    std::unique_lock lock(mutex_);
    if (!unlock_locked(key, owner)) return false;
    record(UnlockOp{key, owner});
    return true;
}

bool Shard::extend_lock_locked(const std::string& key,
                               const std::string& owner,
                               std::chrono::milliseconds ttl) {
    auto current = load_locked(key);
    if (!current) return false;
    if (!lock_owned_by(current->value, owner)) {
        throw EngineError(EngineErrc::LockOwnerMismatch,
                          fmt::format("lock '{}' is not held by '{}'", key, owner));
    }
    current->expires_at = deadline(ttl);
    current->version += 1;
    put_locked(key, std::move(*current), false);
    return true;
}

bool Shard::extend_lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) {
    std::unique_lock lock(mutex_);
    if (!extend_lock_locked(key, owner, ttl)) return false;
    record(ExtendLockOp{key, owner, ttl});
    return true;
}

// ── Maintenance ──────────────────────────────────────────────────────────────

std::size_t Shard::sweep_expired() {
    std::unique_lock lock(mutex_);
    auto now = clock_.now();

    std::vector<std::string> expired;
    for (const auto& [key, slot] : hot_) {
        if (slot.entry.is_expired(now)) expired.push_back(key);
    }
    for (const auto& [key, loc] : cold_) {
        if (loc.expires_at && *loc.expires_at <= now) expired.push_back(key);
    }

    for (const auto& key : expired) {
        erase_locked(key);
    }
    return expired.size();
}

std::size_t Shard::compact() {
    if (!has_budget()) return 0;

    std::lock_guard serial(compaction_mutex_);

    {
        std::unique_lock lock(mutex_);
        if (active_ && active_->size() > 0 &&
            active_->waste_ratio() >= options_.compaction_threshold) {
            active_.reset();  // sealed; the next eviction opens a fresh file
        }
    }

    std::vector<std::shared_ptr<DataFile>> victims;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [fid, file] : files_) {
            if (file == active_) continue;
            if (file->size() > 0 && file->waste_ratio() >= options_.compaction_threshold) {
                victims.push_back(file);
            }
        }
    }

    std::size_t rewritten = 0;
    for (const auto& victim : victims) {
        if (compact_file(victim)) ++rewritten;
    }
    return rewritten;
}

bool Shard::compact_file(const std::shared_ptr<DataFile>& victim) {
    std::vector<std::pair<std::string, ColdLocation>> live;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [key, loc] : cold_) {
            if (loc.file_id == victim->id()) live.emplace_back(key, loc);
        }
    }

    // Copy live records into a fresh file.  Nobody else can see it yet, and
    // the victim is sealed, so no lock is needed here.
    std::shared_ptr<DataFile> fresh;
    std::vector<ColdLocation> moved(live.size());
    if (!live.empty()) {
        uint32_t fid = next_file_id_.fetch_add(1);
        auto path = options_.cold_dir / fmt::format("shard-{}-{}.dat", id_, fid);

        std::error_code ec;
        fresh = DataFile::create(path, fid, ec);
        if (ec) {
            logger_->error("shard {}: compaction cannot create {}: {}", id_, path.string(), ec.message());
            return false;
        }

        std::vector<uint8_t> record;
        for (std::size_t i = 0; i < live.size(); ++i) {
            const auto& loc = live[i].second;
            uint64_t offset = 0;
            ec = victim->read_raw(loc.offset, loc.length, record);
            if (!ec) {
                ec = fresh->append_raw(record, offset);
            }
            if (ec) {
                logger_->error("shard {}: compaction of file {} failed: {}", id_, victim->id(), ec.message());
                fresh->retire();
                return false;
            }
            moved[i] = loc;
            moved[i].file_id = fid;
            moved[i].offset = offset;
        }
    }

    std::unique_lock lock(mutex_);
    for (std::size_t i = 0; i < live.size(); ++i) {
        auto it = cold_.find(live[i].first);
        bool unchanged = it != cold_.end() &&
                         it->second.file_id == victim->id() &&
                         it->second.offset == live[i].second.offset;
        if (unchanged) {
            it->second = moved[i];
        } else {
            fresh->add_dead(moved[i].length);
        }
    }
    if (fresh) {
        files_.emplace(fresh->id(), fresh);
    }
    files_.erase(victim->id());
    victim->retire();
    compactions_.fetch_add(1, std::memory_order_relaxed);

    logger_->debug("shard {}: compacted file {} ({} live records)", id_, victim->id(), live.size());
    return true;
}

// ── Persistence hooks ────────────────────────────────────────────────────────

void Shard::apply(const MutationOp& op) {
    std::unique_lock lock(mutex_);
    try {
        std::visit(
            [this](const auto& m) {
                using T = std::decay_t<decltype(m)>;

                if constexpr (std::is_same_v<T, SetOp>) {
                    set_locked(m.key, m.value, m.ttl);
                } else if constexpr (std::is_same_v<T, DeleteOp>) {
                    erase_locked(m.key);
                } else if constexpr (std::is_same_v<T, IncrOp>) {
                    add_locked(m.key, m.delta, false);
                } else if constexpr (std::is_same_v<T, DecrOp>) {
                    add_locked(m.key, m.delta, true);
                } else if constexpr (std::is_same_v<T, MSetOp>) {
                    for (const auto& [key, value] : m.pairs) {
                        set_locked(key, value, m.ttl);
                    }
                } else if constexpr (std::is_same_v<T, MDelOp>) {
                    mdel_locked(m.keys, nullptr);
                } else if constexpr (std::is_same_v<T, SetNxOp>) {
                    setnx_locked(m.key, m.value, m.ttl);
                } else if constexpr (std::is_same_v<T, LockOp>) {
                    lock_locked(m.key, m.owner, m.ttl, m.acquired_at_ms);
                } else if constexpr (std::is_same_v<T, UnlockOp>) {
                    unlock_locked(m.key, m.owner);
                } else if constexpr (std::is_same_v<T, ExtendLockOp>) {
                    extend_lock_locked(m.key, m.owner, m.ttl);
                }
            },
            op);
    } catch (const EngineError& e) {
        logger_->warn("shard {}: replayed op type {} not applicable: {}",
                      id_, static_cast<int>(op_type(op)), e.what());
    }
}

void Shard::import_entry(const std::string& key, Entry entry) {
    std::unique_lock lock(mutex_);
    put_locked(key, std::move(entry), false);
}

void Shard::visit_locked(const Visitor& fn, uint64_t& last_lsn) const {
    auto now = clock_.now();

    for (const auto& [key, slot] : hot_) {
        if (!slot.entry.is_expired(now)) fn(key, slot.entry);
    }

    for (const auto& [key, loc] : cold_) {
        if (loc.expires_at && *loc.expires_at <= now) continue;
        Entry entry;
        if (auto ec = read_cold(loc, entry)) {
            logger_->warn("shard {}: skipping unreadable cold record for '{}': {}", id_, key, ec.message());
            continue;
        }
        fn(key, entry);
    }

    // Every mutation of this shard that already has a sequence number was
    // applied before we took the lock.
    last_lsn = last_lsn_;
    if (sink_ != nullptr) {
        last_lsn = std::max(last_lsn, sink_->current_lsn());
    }
}

void Shard::visit(const Visitor& fn, uint64_t& last_lsn) const {
    std::shared_lock lock(mutex_);
    visit_locked(fn, last_lsn);
}

bool Shard::try_visit(const Visitor& fn, uint64_t& last_lsn) const {
    std::shared_lock lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return false;
    visit_locked(fn, last_lsn);
    return true;
}

void Shard::set_last_lsn(uint64_t lsn) {
    std::unique_lock lock(mutex_);
    if (lsn > last_lsn_) last_lsn_ = lsn;
}

ShardStats Shard::stats() const {
    std::shared_lock lock(mutex_);
    ShardStats s;
    s.hot_entries = hot_.size();
    s.cold_entries = cold_.size();
    s.hot_bytes = hot_bytes_;
    s.data_files = files_.size();
    s.evictions = evictions_.load(std::memory_order_relaxed);
    s.promotions = promotions_.load(std::memory_order_relaxed);
    s.compactions = compactions_.load(std::memory_order_relaxed);
    s.last_lsn = last_lsn_;
    return s;
}

} // namespace tierkv
