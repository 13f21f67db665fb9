#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "common/Types.h"

namespace quantpulse {
namespace alerts {

// Alert rules as a single JSON document; writes go through a temp file
class AlertRuleStoreJson {
public:
    explicit AlertRuleStoreJson(std::filesystem::path file_path);

    // nullopt when the file is missing or unreadable; invalid entries are skipped
    std::optional<std::vector<AlertRule>> load();
    bool save(const std::vector<AlertRule>& rules);

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace alerts
} // namespace quantpulse
