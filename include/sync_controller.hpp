#pragma once
#include "filter_engine.hpp"

namespace vb
{
// pending flag shared by one pair of engines, at most one push in flight
class SyncContext
{
public:
  class Guard
  {
  public:
    explicit Guard(SyncContext& context) : context(context) { context.pending = true; }
    ~Guard() { context.pending = false; }
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

  private:
    SyncContext& context;
  };

  bool is_pending() const { return pending; }

private:
  bool pending = false;
};

// keeps the selection of two filter engines coherent
class SyncController
{
public:
  SyncController() = default;
  ~SyncController();
  SyncController(const SyncController&) = delete;
  SyncController& operator=(const SyncController&) = delete;

  void pair(FilterEngine& a, FilterEngine& b);
  void unpair();
  bool is_paired() const { return first != nullptr; }

  // pushes the cached selection of initiator onto its sibling
  void match_selection(FilterEngine& initiator);

  SyncContext& get_context() { return context; }

private:
  SyncContext context;
  FilterEngine* first = nullptr;
  FilterEngine* second = nullptr;
  ConnectionId first_connection = 0;
  ConnectionId second_connection = 0;

  void on_event(FilterEngine& engine, FilterEvent event);
};
} // namespace vb
