//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef VIBRA_SERVICE_CACHE_H_
#define VIBRA_SERVICE_CACHE_H_

//! @cond
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>
//! @endcond

namespace vibra {
/**
 * @brief A named key-value store of immutable values.
 *
 * Values are shared: a get() after set() returns the very object that was
 * stored. Implementations must be safe to use from multiple threads.
 */
template <class V>
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  virtual std::string_view name() const = 0;

  /**
   * @brief The value stored under @p key, or nullptr if there is none.
   */
  virtual std::shared_ptr<const V> get(std::string_view key) const = 0;

  virtual void set(std::string_view key, std::shared_ptr<const V> value) = 0;

  virtual bool contains(std::string_view key) const = 0;

protected:
  KeyValueStore() = default;
  KeyValueStore(const KeyValueStore &) = default;
  KeyValueStore &operator=(const KeyValueStore &) = default;
  KeyValueStore(KeyValueStore &&) noexcept = default;
  KeyValueStore &operator=(KeyValueStore &&) noexcept = default;
};

/**
 * @brief In-process store without expiry.
 */
template <class V>
class InMemoryStore: public KeyValueStore<V> {
public:
  explicit InMemoryStore(std::string name): name_(std::move(name)) { }

  std::string_view name() const override { return name_; }

  std::shared_ptr<const V> get(std::string_view key) const override {
    absl::MutexLock lock(&mu_);
    auto it = data_.find(key);
    return it != data_.end() ? it->second : nullptr;
  }

  void set(std::string_view key, std::shared_ptr<const V> value) override {
    absl::MutexLock lock(&mu_);
    data_.insert_or_assign(std::string(key), std::move(value));
  }

  bool contains(std::string_view key) const override {
    absl::MutexLock lock(&mu_);
    return data_.contains(key);
  }

  int size() const {
    absl::MutexLock lock(&mu_);
    return static_cast<int>(data_.size());
  }

private:
  std::string name_;
  mutable absl::Mutex mu_;
  absl::flat_hash_map<std::string, std::shared_ptr<const V>>
      data_ ABSL_GUARDED_BY(mu_);
};

/**
 * @brief One mutex per key, so that at most one thread works on a key at a
 *        time while different keys proceed in parallel.
 *
 * An entry lives only while some thread holds or waits for its key.
 */
class KeyedMutex {
  struct Entry {
    absl::Mutex mu;
    int users = 0;
  };

public:
  class Lock {
  public:
    Lock(KeyedMutex &owner, std::string_view key)
        : owner_(owner), key_(key), entry_(owner.acquire(key_)) {
      entry_->mu.Lock();
    }

    Lock(const Lock &) = delete;
    Lock &operator=(const Lock &) = delete;
    Lock(Lock &&) = delete;
    Lock &operator=(Lock &&) = delete;

    ~Lock() {
      entry_->mu.Unlock();
      owner_.release(key_);
    }

  private:
    KeyedMutex &owner_;
    std::string key_;
    Entry *entry_;
  };

  /**
   * @brief Number of keys currently held or waited for.
   */
  int size() const {
    absl::MutexLock lock(&mu_);
    return static_cast<int>(entries_.size());
  }

private:
  Entry *acquire(const std::string &key) {
    absl::MutexLock lock(&mu_);
    std::unique_ptr<Entry> &entry = entries_[key];
    if (!entry)
      entry = std::make_unique<Entry>();
    ++entry->users;
    return entry.get();
  }

  void release(const std::string &key) {
    absl::MutexLock lock(&mu_);
    auto it = entries_.find(key);
    if (it != entries_.end() && --it->second->users == 0)
      entries_.erase(it);
  }

  mutable absl::Mutex mu_;
  absl::flat_hash_map<std::string, std::unique_ptr<Entry>> entries_
      ABSL_GUARDED_BY(mu_);
};
}  // namespace vibra

#endif /* VIBRA_SERVICE_CACHE_H_ */
