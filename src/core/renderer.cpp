#include "gitwip/renderer.h"

#include <ostream>

namespace gitwip {

Renderer::Renderer(const Config::Options& options, std::ostream& output)
    : options_{options}, out_{output} {}

bool Renderer::render(const WipReport& report) {
    if (report.clean()) {
        return false;
    }
    out_ << label_for(report.repository) << '\n';
    for (const auto& finding : report.findings) {
        out_ << "  " << finding << '\n';
    }
    return true;
}

void Renderer::render_repositories(const std::vector<std::filesystem::path>& repositories) {
    for (const auto& repository : repositories) {
        out_ << repository.string() << '\n';
    }
}

std::string Renderer::label_for(const std::filesystem::path& repository) const {
    if (options_.full_path) {
        return repository.string();
    }
    auto name = repository.filename().string();
    return name.empty() ? repository.string() : name;
}

} // namespace gitwip
