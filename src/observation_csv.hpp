// observation_csv.hpp
#pragma once

#include "types.hpp"

#include <istream>
#include <string>
#include <vector>

namespace umpire {

// Recorded detector output, one frame per line:
//
//   frame,timestamp_ms,x,y,confidence,visibility[,bat_x,bat_y,bat_w,bat_h[,pad_x,pad_y,pad_w,pad_h]]
//
// Empty x/y is a frame without a detection. A header line starting with
// "frame" and lines starting with '#' are skipped. Malformed lines throw
// std::runtime_error naming the line.
std::vector<Observation> readObservations(std::istream& in);
std::vector<Observation> readObservationsFile(const std::string& path);

Visibility parseVisibility(const std::string& name);

}  // namespace umpire
