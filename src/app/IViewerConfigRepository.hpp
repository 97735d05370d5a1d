#pragma once

#include "domain/domain_model.hpp"

namespace shogi::review::app {

// Port/interface for reading/writing viewer settings.
// Implementations live in infra (JSON file).
class IViewerConfigRepository {
public:
    virtual ~IViewerConfigRepository() = default;

    virtual shogi::review::domain::ViewerSettings load() const = 0;
    virtual bool save(const shogi::review::domain::ViewerSettings& settings) const = 0;
};

} // namespace shogi::review::app
