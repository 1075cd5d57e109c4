#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "gitwip/config.h"
#include "gitwip/wip_aggregator.h"

namespace gitwip {

class Renderer {
public:
    Renderer(const Config::Options& options, std::ostream& output);

    // Writes nothing for a report without findings. Returns whether anything
    // was written.
    bool render(const WipReport& report);
    void render_repositories(const std::vector<std::filesystem::path>& repositories);

private:
    std::string label_for(const std::filesystem::path& repository) const;

    const Config::Options& options_;
    std::ostream& out_;
};

} // namespace gitwip
