//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "cli/LaunchContext.hpp"

namespace novella::cli
{

SessionMarkers readSessionMarkers(const support::SessionStore &store)
{
    SessionMarkers markers;
    markers.reload = store.getFlag(kReloadMarker);
    markers.compileRequested = store.getFlag(kCompileMarker);
    markers.warped = store.getFlag(kWarpedMarker);
    return markers;
}

void writeSessionMarkers(const SessionMarkers &markers, support::SessionStore &store)
{
    if (markers.warped)
    {
        store.set(std::string(kWarpedMarker), true);
    }
}

} // namespace novella::cli
