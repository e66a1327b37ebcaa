#pragma once

#include "grid/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace grid {

struct ProtectionState {
    TrendDirection direction = TrendDirection::Neutral;
    int consecutive_bars = 0;
    double cumulative_change_pct = 0.0;
    double run_start_price = 0.0;
    std::optional<TimePoint> run_start_time;
    std::optional<double> baseline_volatility;
    bool protection_active = false;
    std::optional<TimePoint> hibernation_start;
    std::optional<TimePoint> last_update;
};

std::string format_iso8601(TimePoint time);
std::optional<TimePoint> parse_iso8601(const std::string& text);

// Single JSON record, replaced atomically (temp file, fsync, rename).
class ProtectionStateStore {
public:
    explicit ProtectionStateStore(std::filesystem::path path);

    // nullopt when no file exists; a corrupt file is logged and treated as absent.
    std::optional<ProtectionState> load() const;
    bool save(const ProtectionState& state) const;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace grid
