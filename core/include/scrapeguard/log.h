#pragma once

#include <json-c/json.h>

#include <fstream>
#include <string>

namespace scrapeguard {

struct RunHeader {
    std::string run_id;
    std::string request_id;
};

// One JSON object per line:
//   {"attempt":n,"event":"...","payload":{...},"request_id":"...","run_id":"...","ts":"..."}
// Keys are written sorted so two logs of the same run diff cleanly.
// A logger constructed with an empty path is disabled and drops events.
class EventLog {
public:
    EventLog() = default;
    EventLog(RunHeader hdr, const std::string& path);

    bool enabled() const { return out_.is_open(); }

    // Takes ownership of payload (may be null).
    void event(int attempt, const std::string& name, json_object* payload);

    const std::string& path() const { return path_; }
    const RunHeader& header() const { return hdr_; }
    size_t events_written() const { return written_; }

private:
    RunHeader hdr_;
    std::string path_;
    std::ofstream out_;
    size_t written_{0};
};

// UTC, second resolution: 2024-01-31T12:00:00Z
std::string iso_now();

} // namespace scrapeguard
