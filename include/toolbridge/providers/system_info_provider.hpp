#pragma once

#include <toolbridge/registry/i_capability_provider.hpp>

#include <chrono>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace toolbridge {

// ---------------------------------------------------------------------------
// /proc parsing helpers (exposed for tests).
// ---------------------------------------------------------------------------

// Jiffies of one "cpu" line of /proc/stat.
struct CpuTimes {
    uint64_t busy = 0;
    uint64_t total = 0;
};

// Aggregate ("cpu") first, then one entry per core ("cpu0", "cpu1", ...).
Result<std::vector<CpuTimes>, std::string> ParseProcStat(std::istream& in);

// Busy share between two samples, in percent [0, 100]. 0 when no time passed.
double CpuUsagePercent(const CpuTimes& before, const CpuTimes& after);

struct MemInfo {
    uint64_t total_kb = 0;
    uint64_t free_kb = 0;
    uint64_t available_kb = 0;
    uint64_t swap_total_kb = 0;
    uint64_t swap_free_kb = 0;
};

// Requires MemTotal and MemFree. MemAvailable falls back to MemFree.
Result<MemInfo, std::string> ParseMemInfo(std::istream& in);

struct LoadAverage {
    double one = 0.0;
    double five = 0.0;
    double fifteen = 0.0;
};

Result<LoadAverage, std::string> ParseLoadAverage(std::istream& in);

// ---------------------------------------------------------------------------
// SystemInfoProvider: "system_info.query": CPU, memory, disk and OS facts
// of the host, read from procfs, statvfs and uname.
// ---------------------------------------------------------------------------
struct SystemInfoOptions {
    std::chrono::milliseconds cpu_sample{200};
    std::string proc_root = "/proc";
    std::string disk_path = "/";
};

class SystemInfoProvider : public ICapabilityProvider {
public:
    explicit SystemInfoProvider(SystemInfoOptions options = {});

    [[nodiscard]] std::string Name() const override { return "system_info"; }
    [[nodiscard]] std::vector<CapabilityDescriptor> Capabilities() const override;

    /// Fails when procfs is not readable under options.proc_root.
    [[nodiscard]] Result<void, Error> Init() override;

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        const std::string& operation,
        const nlohmann::json& arguments) override;

private:
    Result<nlohmann::json, Error> Cpu(bool details) const;
    Result<nlohmann::json, Error> Memory(bool details) const;
    Result<nlohmann::json, Error> Disk(bool details) const;
    Result<nlohmann::json, Error> Os(bool details) const;

    SystemInfoOptions options_;
};

} // namespace toolbridge
