#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "Common.h"

namespace wasp {

// `fresh` is true when no live entry existed for the key.
using ActorUpdateFn = std::function<void(ActorState& state, bool fresh)>;

class IActorStateStore {
 public:
  virtual ~IActorStateStore() = default;

  // Runs `fn` with exclusive access to the state of `key`. A missing or
  // expired entry is presented as a default ActorState. On success the entry
  // expires at now_ms + ttl_ms.
  virtual StoreStatus update(const std::string& key, TimeMs now_ms, TimeMs ttl_ms,
                             const ActorUpdateFn& fn) = 0;

  // Drops entries idle past their deadline, returns how many were dropped.
  virtual size_t sweep(TimeMs now_ms) = 0;
  virtual size_t size() const = 0;
};

class MemoryActorStateStore final : public IActorStateStore {
 public:
  StoreStatus update(const std::string& key, TimeMs now_ms, TimeMs ttl_ms,
                     const ActorUpdateFn& fn) override;
  size_t sweep(TimeMs now_ms) override;
  size_t size() const override;

 private:
  struct Slot {
    std::mutex mu;
    ActorState state{};
    TimeMs expires_ms{0};
    bool live{false};
    bool erased{false};
  };

  std::shared_ptr<Slot> acquire(const std::string& key);

  mutable std::mutex map_mu_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace wasp
