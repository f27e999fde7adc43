#include <toolbridge/providers/system_info_provider.hpp>

#include <toolbridge/core/log.hpp>

#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <thread>

namespace toolbridge {

namespace {

constexpr const char* kOsReleasePath = "/etc/os-release";

Error SystemInfoError(const std::string& message,
                 std::optional<std::string> detail = std::nullopt) {
    return Error{"SystemInfo", message, ErrorCode::ExecutionFailed, std::move(detail), {}};
}

double Round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double Percent(uint64_t part, uint64_t whole) {
    if (whole == 0) return 0.0;
    return Round2(static_cast<double>(part) * 100.0 / static_cast<double>(whole));
}

template <typename T, typename Parser>
Result<T, Error> ReadProcFile(const std::string& path, Parser parse) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<T, Error>::Err(SystemInfoError("cannot open " + path));
    }
    auto parsed = parse(file);
    if (parsed.IsErr()) {
        return Result<T, Error>::Err(SystemInfoError("cannot parse " + path, parsed.Error()));
    }
    return Result<T, Error>::Ok(std::move(parsed).Value());
}

std::string Unquote(std::string value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// NAME and VERSION_ID from an os-release file; empty strings when absent.
std::pair<std::string, std::string> ReadOsRelease(const std::string& path) {
    std::ifstream file(path);
    std::string name;
    std::string version;
    std::string line;
    while (std::getline(file, line)) {
        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        const auto key = line.substr(0, eq);
        if (key == "NAME") {
            name = Unquote(line.substr(eq + 1));
        } else if (key == "VERSION_ID") {
            version = Unquote(line.substr(eq + 1));
        }
    }
    return {name, version};
}

void Merge(nlohmann::json& into, const nlohmann::json& from) {
    for (auto it = from.begin(); it != from.end(); ++it) {
        into[it.key()] = it.value();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------
Result<std::vector<CpuTimes>, std::string> ParseProcStat(std::istream& in) {
    using R = Result<std::vector<CpuTimes>, std::string>;
    std::vector<CpuTimes> out;
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("cpu", 0) != 0) continue;

        std::istringstream fields(line);
        std::string label;
        fields >> label;
        if (out.empty() && label != "cpu") {
            return R::Err("aggregate 'cpu' line must come first");
        }

        // user nice system idle iowait irq softirq steal
        std::array<uint64_t, 8> values{};
        size_t count = 0;
        while (count < values.size() && fields >> values[count]) {
            ++count;
        }
        if (count < 4) {
            return R::Err("too few fields on '" + label + "' line");
        }

        CpuTimes times;
        for (size_t i = 0; i < count; ++i) {
            times.total += values[i];
        }
        const uint64_t idle = values[3] + (count > 4 ? values[4] : 0);
        times.busy = times.total - idle;
        out.push_back(times);
    }
    if (out.empty()) {
        return R::Err("no 'cpu' line found");
    }
    return R::Ok(std::move(out));
}

double CpuUsagePercent(const CpuTimes& before, const CpuTimes& after) {
    if (after.total <= before.total || after.busy < before.busy) {
        return 0.0;
    }
    const auto total = after.total - before.total;
    const auto busy = after.busy - before.busy;
    const double share = Percent(busy, total);
    return share > 100.0 ? 100.0 : share;
}

Result<MemInfo, std::string> ParseMemInfo(std::istream& in) {
    using R = Result<MemInfo, std::string>;
    MemInfo info;
    bool has_total = false;
    bool has_free = false;
    bool has_available = false;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t value = 0;
        if (!(fields >> key >> value)) continue;

        if (key == "MemTotal:") {
            info.total_kb = value;
            has_total = true;
        } else if (key == "MemFree:") {
            info.free_kb = value;
            has_free = true;
        } else if (key == "MemAvailable:") {
            info.available_kb = value;
            has_available = true;
        } else if (key == "SwapTotal:") {
            info.swap_total_kb = value;
        } else if (key == "SwapFree:") {
            info.swap_free_kb = value;
        }
    }

    if (!has_total || !has_free) {
        return R::Err("MemTotal and MemFree are required");
    }
    if (!has_available) {
        info.available_kb = info.free_kb;
    }
    return R::Ok(info);
}

Result<LoadAverage, std::string> ParseLoadAverage(std::istream& in) {
    LoadAverage load;
    if (!(in >> load.one >> load.five >> load.fifteen)) {
        return Result<LoadAverage, std::string>::Err("expected three load figures");
    }
    return Result<LoadAverage, std::string>::Ok(load);
}

// ---------------------------------------------------------------------------
// SystemInfoProvider
// ---------------------------------------------------------------------------
SystemInfoProvider::SystemInfoProvider(SystemInfoOptions options)
    : options_(std::move(options)) {}

std::vector<CapabilityDescriptor> SystemInfoProvider::Capabilities() const {
    return {{
        "query",
        "Get current system information: CPU usage, memory usage, disk usage "
        "and operating system details.",
        {
            {"type", "object"},
            {"properties", {
                {"info_type", {
                    {"type", "string"},
                    {"enum", {"all", "cpu", "memory", "disk", "os"}},
                    {"description", "Which facts to report (default: all)"}
                }},
                {"include_details", {
                    {"type", "boolean"},
                    {"description", "Add detailed statistics (per-core usage, swap, uptime)"}
                }}
            }},
            {"additionalProperties", false}
        }
    }};
}

Result<void, Error> SystemInfoProvider::Init() {
    std::ifstream meminfo(options_.proc_root + "/meminfo");
    if (!meminfo.is_open()) {
        return Result<void, Error>::Err(Error{
            "Init", "procfs is not readable", ErrorCode::RegistryFault,
            options_.proc_root, {}});
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> SystemInfoProvider::Execute(
    const std::string& operation, const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;
    if (operation != "query") {
        return R::Err(SystemInfoError("unsupported operation '" + operation + "'"));
    }

    const auto info_type = arguments.value("info_type", std::string("all"));
    const bool details = arguments.value("include_details", false);
    LogDebug("system_info", "query info_type=" + info_type);

    if (info_type == "cpu") return Cpu(details);
    if (info_type == "memory") return Memory(details);
    if (info_type == "disk") return Disk(details);
    if (info_type == "os") return Os(details);
    if (info_type != "all") {
        return R::Err(SystemInfoError("unknown info_type '" + info_type + "'"));
    }

    nlohmann::json all = nlohmann::json::object();
    for (auto section : {&SystemInfoProvider::Cpu, &SystemInfoProvider::Memory,
                         &SystemInfoProvider::Disk, &SystemInfoProvider::Os}) {
        auto part = (this->*section)(details);
        if (part.IsErr()) {
            return part;
        }
        Merge(all, part.Value());
    }
    return R::Ok(std::move(all));
}

Result<nlohmann::json, Error> SystemInfoProvider::Cpu(bool details) const {
    using R = Result<nlohmann::json, Error>;
    const auto stat_path = options_.proc_root + "/stat";

    auto before = ReadProcFile<std::vector<CpuTimes>>(stat_path, ParseProcStat);
    if (before.IsErr()) return R::Err(before.Error());
    std::this_thread::sleep_for(options_.cpu_sample);
    auto after = ReadProcFile<std::vector<CpuTimes>>(stat_path, ParseProcStat);
    if (after.IsErr()) return R::Err(after.Error());

    const auto& first = before.Value();
    const auto& second = after.Value();

    nlohmann::json out = {
        {"cpu_usage", CpuUsagePercent(first.front(), second.front())},
        {"cpu_count", second.size() - 1}
    };

    auto load = ReadProcFile<LoadAverage>(options_.proc_root + "/loadavg",
                                          ParseLoadAverage);
    if (load.IsOk()) {
        out["load_average"] = {
            {"one", load.Value().one},
            {"five", load.Value().five},
            {"fifteen", load.Value().fifteen}
        };
    }

    if (details) {
        nlohmann::json cores = nlohmann::json::array();
        for (size_t i = 1; i < first.size() && i < second.size(); ++i) {
            cores.push_back(CpuUsagePercent(first[i], second[i]));
        }
        out["per_core_usage"] = std::move(cores);
    }
    return R::Ok(std::move(out));
}

Result<nlohmann::json, Error> SystemInfoProvider::Memory(bool details) const {
    using R = Result<nlohmann::json, Error>;
    auto mem = ReadProcFile<MemInfo>(options_.proc_root + "/meminfo", ParseMemInfo);
    if (mem.IsErr()) return R::Err(mem.Error());

    const auto& m = mem.Value();
    const uint64_t used = m.total_kb > m.available_kb ? m.total_kb - m.available_kb : 0;

    nlohmann::json out = {
        {"total_memory_kb", m.total_kb},
        {"used_memory_kb", used},
        {"memory_usage_percent", Percent(used, m.total_kb)}
    };
    if (details) {
        out["free_memory_kb"] = m.free_kb;
        out["available_memory_kb"] = m.available_kb;
        out["swap_total_kb"] = m.swap_total_kb;
        out["swap_used_kb"] = m.swap_total_kb > m.swap_free_kb
                                  ? m.swap_total_kb - m.swap_free_kb : 0;
    }
    return R::Ok(std::move(out));
}

Result<nlohmann::json, Error> SystemInfoProvider::Disk(bool details) const {
    using R = Result<nlohmann::json, Error>;
    struct statvfs fs{};
    if (statvfs(options_.disk_path.c_str(), &fs) != 0) {
        return R::Err(SystemInfoError("statvfs failed", options_.disk_path));
    }

    const uint64_t unit = fs.f_frsize != 0 ? fs.f_frsize : fs.f_bsize;
    const uint64_t total_kb = static_cast<uint64_t>(fs.f_blocks) * unit / 1024;
    const uint64_t free_kb = static_cast<uint64_t>(fs.f_bfree) * unit / 1024;
    const uint64_t available_kb = static_cast<uint64_t>(fs.f_bavail) * unit / 1024;
    const uint64_t used_kb = total_kb > free_kb ? total_kb - free_kb : 0;

    nlohmann::json out = {
        {"disk_path", options_.disk_path},
        {"total_disk_kb", total_kb},
        {"used_disk_kb", used_kb},
        {"available_disk_kb", available_kb},
        // df semantics: share of the space available to unprivileged users.
        {"disk_usage_percent", Percent(used_kb, used_kb + available_kb)}
    };
    if (details) {
        out["free_disk_kb"] = free_kb;
        out["total_inodes"] = static_cast<uint64_t>(fs.f_files);
        out["free_inodes"] = static_cast<uint64_t>(fs.f_ffree);
    }
    return R::Ok(std::move(out));
}

Result<nlohmann::json, Error> SystemInfoProvider::Os(bool details) const {
    using R = Result<nlohmann::json, Error>;
    struct utsname uts{};
    if (uname(&uts) != 0) {
        return R::Err(SystemInfoError("uname failed"));
    }

    std::array<char, 256> host{};
    std::string hostname;
    if (gethostname(host.data(), host.size() - 1) == 0) {
        hostname = host.data();
    } else {
        hostname = uts.nodename;
    }

    auto [name, version] = ReadOsRelease(kOsReleasePath);
    nlohmann::json out = {
        {"os_name", name.empty() ? std::string(uts.sysname) : name},
        {"os_version", version.empty() ? std::string(uts.release) : version},
        {"kernel_version", uts.release},
        {"architecture", uts.machine},
        {"hostname", hostname}
    };

    if (details) {
        std::ifstream uptime(options_.proc_root + "/uptime");
        double seconds = 0.0;
        if (uptime >> seconds) {
            out["uptime_seconds"] = static_cast<uint64_t>(seconds);
        }
    }
    return R::Ok(std::move(out));
}

} // namespace toolbridge
