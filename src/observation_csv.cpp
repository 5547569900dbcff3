// observation_csv.cpp
#include "observation_csv.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace umpire {

namespace {

std::string trim(const std::string& s) {
    const auto first = std::find_if_not(s.begin(), s.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                       [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

bool parseRegion(const std::vector<std::string>& f, size_t at, PlayerRegion::Kind kind,
                 PlayerRegion& out) {
    if (f.size() < at + 4) return false;
    for (size_t i = at; i < at + 4; ++i) {
        if (f[i].empty()) return false;
    }
    out.kind = kind;
    out.box = cv::Rect2f(std::stof(f[at]), std::stof(f[at + 1]),
                         std::stof(f[at + 2]), std::stof(f[at + 3]));
    return true;
}

Observation parseLine(const std::vector<std::string>& f) {
    if (f.size() < 6) {
        throw std::invalid_argument("expected at least 6 fields, got " + std::to_string(f.size()));
    }

    const int frame = std::stoi(f[0]);
    const double timestamp = f[1].empty() ? 0.0 : std::stod(f[1]);

    if (f[2].empty() || f[3].empty()) {
        return NoDetection{frame, timestamp};
    }

    BallDetection det;
    det.frame_index = frame;
    det.timestamp_ms = timestamp;
    det.position = cv::Point2f(std::stof(f[2]), std::stof(f[3]));
    det.confidence = f[4].empty() ? 1.0f : std::stof(f[4]);
    det.visibility = f[5].empty() ? Visibility::VISIBLE : parseVisibility(f[5]);

    PlayerRegion region;
    if (parseRegion(f, 6, PlayerRegion::Kind::BAT, region)) det.players.push_back(region);
    if (parseRegion(f, 10, PlayerRegion::Kind::PAD, region)) det.players.push_back(region);
    return det;
}

}  // namespace

Visibility parseVisibility(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "visible") return Visibility::VISIBLE;
    if (lower == "occluded") return Visibility::OCCLUDED;
    if (lower == "absent") return Visibility::ABSENT;
    throw std::invalid_argument("unknown visibility '" + name + "'");
}

std::vector<Observation> readObservations(std::istream& in) {
    std::vector<Observation> out;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t.rfind("frame", 0) == 0) continue;

        try {
            out.push_back(parseLine(split(t)));
        } catch (const std::exception& e) {
            throw std::runtime_error("observations line " + std::to_string(line_no) +
                                     ": " + e.what());
        }
    }
    return out;
}

std::vector<Observation> readObservationsFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open observations file " + path);
    }
    return readObservations(in);
}

}  // namespace umpire
