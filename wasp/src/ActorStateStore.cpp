#include "wasp/ActorStateStore.h"

namespace wasp {

std::shared_ptr<MemoryActorStateStore::Slot> MemoryActorStateStore::acquire(const std::string& key) {
  std::lock_guard<std::mutex> lock(map_mu_);
  auto& slot = slots_[key];
  if (!slot) slot = std::make_shared<Slot>();
  return slot;
}

StoreStatus MemoryActorStateStore::update(const std::string& key, TimeMs now_ms, TimeMs ttl_ms,
                                          const ActorUpdateFn& fn) {
  for (;;) {
    std::shared_ptr<Slot> slot = acquire(key);
    std::lock_guard<std::mutex> lock(slot->mu);
    // Lost a race with sweep(); the map now holds (or will hold) a new slot.
    if (slot->erased) continue;

    bool fresh = !slot->live || now_ms >= slot->expires_ms;
    if (fresh) slot->state = ActorState{};
    fn(slot->state, fresh);
    slot->expires_ms = now_ms + ttl_ms;
    slot->live = true;
    return StoreStatus::Ok;
  }
}

size_t MemoryActorStateStore::sweep(TimeMs now_ms) {
  std::lock_guard<std::mutex> lock(map_mu_);
  size_t dropped = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    std::shared_ptr<Slot> hold = it->second;
    Slot& slot = *hold;
    std::unique_lock<std::mutex> slot_lock(slot.mu, std::try_to_lock);
    // A busy slot is in use right now, so it is not idle.
    if (slot_lock.owns_lock() && (!slot.live || now_ms >= slot.expires_ms)) {
      slot.erased = true;
      it = slots_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

size_t MemoryActorStateStore::size() const {
  std::lock_guard<std::mutex> lock(map_mu_);
  return slots_.size();
}

} // namespace wasp
