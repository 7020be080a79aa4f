#pragma once

#include "desktop_blocks/tracking/tracking_types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace mavtrack {

// Wire form shared by every sink, so consumers see the same document
// whichever broker it came through.
nlohmann::json to_json(const TrackingUpdate& update);
std::string serialize_tracking_update(const TrackingUpdate& update);

} // namespace mavtrack
