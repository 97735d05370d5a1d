#pragma once

#include <string>

#include "domain/domain_model.hpp"
#include "app/IViewerConfigRepository.hpp"

namespace shogi::review::infra {

class ViewerConfigRepository : public shogi::review::app::IViewerConfigRepository {
public:
    explicit ViewerConfigRepository(std::string path);

    // Load settings from the JSON file.
    // A missing or invalid file yields defaults and logs a warning; an invalid
    // value falls back to the default of that key.
    shogi::review::domain::ViewerSettings load() const override;

    bool save(const shogi::review::domain::ViewerSettings& settings) const override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace shogi::review::infra
