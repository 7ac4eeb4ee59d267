#include "rollcal/core/CalendarLayout.hpp"

#include "rollcal/core/Logging.hpp"
#include "rollcal/data/EventSource.hpp"

namespace rollcal {
namespace core {

CalendarLayout layoutCalendar(const data::EventSource &source,
                              const QDate &anchor,
                              const LayoutConfig &config,
                              const data::OwnerPalette &palette)
{
    CalendarLayout layout{ computeWindow(anchor), {}, {}, {}, {} };
    layout.store = data::buildEvents(source.fetchRecords(), palette);
    layout.packing = pack(layout.store.events, layout.window);
    layout.bands = synthesizeBands(layout.store.events, layout.packing, layout.window, layout.store.colors);
    layout.geometry = mapToPixels(layout.window, layout.bands, layout.packing.maxRowCount(), config);

    qCDebug(lcLayout) << "Window" << layout.window.firstDay() << "to" << layout.window.lastDay() << "with"
                      << layout.bands.size() << "bands, cell height" << layout.geometry.cellHeight;
    return layout;
}

} // namespace core
} // namespace rollcal
