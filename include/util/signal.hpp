#pragma once
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace vb
{
using ConnectionId = uint32_t;

// minimal observer list; slots are copied before emitting so a slot may
// connect or disconnect while the signal is being emitted
template<class... Args>
class Signal
{
public:
  using Slot = std::function<void(Args...)>;

  ConnectionId connect(Slot slot)
  {
    ConnectionId id = next_id++;
    slots.emplace_back(id, std::move(slot));
    return id;
  }

  void disconnect(ConnectionId id)
  {
    for (auto it = slots.begin(); it != slots.end(); ++it)
    {
      if (it->first == id)
      {
        slots.erase(it);
        return;
      }
    }
  }

  void emit(Args... args) const
  {
    auto current = slots;
    for (const auto& [id, slot] : current)
    {
      if (slot) slot(args...);
    }
  }

  size_t size() const { return slots.size(); }

private:
  ConnectionId next_id = 1;
  std::vector<std::pair<ConnectionId, Slot>> slots;
};
} // namespace vb
