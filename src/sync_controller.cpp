#include "sync_controller.hpp"

#include "util/vb_log.hpp"

namespace vb
{
SyncController::~SyncController()
{
    unpair();
}

void SyncController::pair(FilterEngine& a, FilterEngine& b)
{
    unpair();
    first = &a;
    second = &b;
    a.set_sibling(&b, &context);
    b.set_sibling(&a, &context);

    auto listener = [this](FilterEngine& engine, FilterEvent event) { on_event(engine, event); };
    first_connection = a.subscribe(listener);
    second_connection = b.subscribe(listener);
}

void SyncController::unpair()
{
    if (!first) return;
    first->unsubscribe(first_connection);
    second->unsubscribe(second_connection);
    first->set_sibling(nullptr, nullptr);
    second->set_sibling(nullptr, nullptr);
    first = second = nullptr;
    first_connection = second_connection = 0;
}

void SyncController::on_event(FilterEngine& engine, FilterEvent event)
{
    if (event == FilterEvent::MatchRequested) match_selection(engine);
}

void SyncController::match_selection(FilterEngine& initiator)
{
    if (context.is_pending())
    {
        VB_DEBUG(initiator.get_view().get_name() << ": selection update is pending.");
        return;
    }

    FilterEngine* sibling = initiator.get_sibling();
    if (!sibling) return;

    SyncContext::Guard guard(context);
    std::vector<int> rows = initiator.selected_rows();
    VB_DEBUG(initiator.get_view().get_name() << ": syncing " << rows.size() << " row(s) to " << sibling->get_view().get_name());
    sibling->select_rows(rows);
}
} // namespace vb
