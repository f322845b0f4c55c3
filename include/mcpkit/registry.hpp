#pragma once
#include "error.hpp"
#include "handler.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpkit {

/// Decode a listing cursor. Cursors are the decimal offset of the next item.
/// Throws McpProtocolError(InvalidParams) for anything else.
size_t decode_cursor(const std::optional<std::string>& cursor, size_t total);

/// Slice `items` into one page. page_size 0 returns everything.
template <typename T>
PaginatedResult<T> paginate(const std::vector<T>& items, size_t page_size,
                            const std::optional<std::string>& cursor) {
    size_t start = decode_cursor(cursor, items.size());
    size_t end = page_size == 0 ? items.size() : std::min(start + page_size, items.size());

    PaginatedResult<T> page;
    page.items.assign(items.begin() + static_cast<std::ptrdiff_t>(start),
                      items.begin() + static_cast<std::ptrdiff_t>(end));
    if (end < items.size()) page.next_cursor = std::to_string(end);
    return page;
}

/// Name-keyed store of handlers of one kind.
///
/// Readers work on immutable snapshots: every mutation builds a new
/// snapshot and swaps it in, so a reader sees the registry either entirely
/// before or entirely after any add/remove. Handlers are shared, which
/// keeps a removed handler alive until calls already running against it
/// return.
template <typename Info, typename Handler>
class HandlerRegistry {
public:
    struct Entry {
        std::string key;
        Info info;
        std::shared_ptr<Handler> handler;
    };

    struct Snapshot {
        std::vector<Entry> entries;  // registration order
        std::unordered_map<std::string, size_t> index;

        const Entry* find(const std::string& key) const {
            auto it = index.find(key);
            return it == index.end() ? nullptr : &entries[it->second];
        }
    };

    using SnapshotPtr = std::shared_ptr<const Snapshot>;
    using ChangeListener = std::function<void()>;
    /// Throws McpValidationError to refuse a registration.
    using Validator = std::function<void(const std::string& key, const Info& info)>;

    HandlerRegistry() : snapshot_(std::make_shared<const Snapshot>()) {}

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    /// Invoked after every successful add/remove, outside the registry lock.
    void set_change_listener(ChangeListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = std::move(listener);
    }

    /// Checked by every add() before anything changes.
    void set_validator(Validator validator) {
        std::lock_guard<std::mutex> lock(mutex_);
        validator_ = std::move(validator);
    }

    /// Insert or replace. A replaced entry moves to the end of the listing.
    void add(std::string key, Info info, std::shared_ptr<Handler> handler) {
        if (!handler) throw McpValidationError("Handler must not be null: " + key);
        Validator validator;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            validator = validator_;
        }
        if (validator) validator(key, info);

        ChangeListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto next = std::make_shared<Snapshot>();
            next->entries.reserve(snapshot_->entries.size() + 1);
            for (const auto& e : snapshot_->entries) {
                if (e.key != key) next->entries.push_back(e);
            }
            next->entries.push_back(Entry{std::move(key), std::move(info), std::move(handler)});
            reindex(*next);
            snapshot_ = std::move(next);
            listener = listener_;
        }
        if (listener) listener();
    }

    /// Returns false if the key was not registered (no event fires).
    bool remove(const std::string& key) {
        ChangeListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!snapshot_->find(key)) return false;
            auto next = std::make_shared<Snapshot>();
            next->entries.reserve(snapshot_->entries.size());
            for (const auto& e : snapshot_->entries) {
                if (e.key != key) next->entries.push_back(e);
            }
            reindex(*next);
            snapshot_ = std::move(next);
            listener = listener_;
        }
        if (listener) listener();
        return true;
    }

    /// nullptr when absent.
    [[nodiscard]] std::shared_ptr<Handler> get(const std::string& key) const {
        auto snap = snapshot();
        const Entry* e = snap->find(key);
        return e ? e->handler : nullptr;
    }

    /// Exact match first, then the entry whose key is the longest prefix of
    /// `key`.
    [[nodiscard]] std::optional<Entry> resolve(const std::string& key) const {
        auto snap = snapshot();
        if (const Entry* e = snap->find(key)) return *e;

        const Entry* best = nullptr;
        for (const auto& e : snap->entries) {
            if (e.key.size() < key.size() && key.compare(0, e.key.size(), e.key) == 0) {
                if (!best || e.key.size() > best->key.size()) best = &e;
            }
        }
        if (best) return *best;
        return std::nullopt;
    }

    [[nodiscard]] SnapshotPtr snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    /// Registered metadata, in registration order.
    [[nodiscard]] std::vector<Info> infos() const {
        auto snap = snapshot();
        std::vector<Info> out;
        out.reserve(snap->entries.size());
        for (const auto& e : snap->entries) out.push_back(e.info);
        return out;
    }

    [[nodiscard]] PaginatedResult<Info> list(size_t page_size,
                                             const std::optional<std::string>& cursor) const {
        return paginate(infos(), page_size, cursor);
    }

    [[nodiscard]] size_t size() const { return snapshot()->entries.size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    static void reindex(Snapshot& s) {
        s.index.clear();
        for (size_t i = 0; i < s.entries.size(); ++i) s.index[s.entries[i].key] = i;
    }

    mutable std::mutex mutex_;
    SnapshotPtr snapshot_;
    ChangeListener listener_;
    Validator validator_;
};

using ToolRegistry = HandlerRegistry<ToolInfo, ToolHandler>;
using ResourceRegistry = HandlerRegistry<ResourceInfo, ResourceHandler>;
using PromptRegistry = HandlerRegistry<PromptInfo, PromptHandler>;

} // namespace mcpkit
